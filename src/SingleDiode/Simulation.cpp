/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */
/**
 * @file Simulation.cpp
 * @brief Current/voltage solves, derivative curves and power at voltage.
 *
 * Each public function builds one `ParameterBatch` (the single place where
 * broadcasting happens), works on flat Eigen arrays, and wraps the results
 * back into the batch shape.
 */

#include <Eigen/Dense>

#include "HalleySolver.hpp"
#include "SingleDiodeEquation.hpp"
#include "SingleDiodeResidual.hpp"

Eigen::ArrayXd solveCurrent(const ParameterBatch &p, const Eigen::ArrayXd &V_V,
                            const SolverOptions &options)
{
    options.validate();

    HalleyFunction residual = [&p, &V_V](const Eigen::ArrayXd &I_A) {
        return residualInCurrent(p, I_A, V_V);
    };

    HalleyResult result =
        solveHalley(residual, currentInitialCondition(p, V_V), options, "I_A");
    requireConvergence(result, "I_A");
    return result.root;
}

Eigen::ArrayXd solveVoltage(const ParameterBatch &p, const Eigen::ArrayXd &I_A,
                            const SolverOptions &options)
{
    options.validate();

    // May throw DomainError; must happen before any iteration.
    const Eigen::ArrayXd V_ic = voltageInitialCondition(p, I_A);

    HalleyFunction residual = [&p, &I_A](const Eigen::ArrayXd &V_V) {
        return residualInVoltage(p, I_A, V_V);
    };

    HalleyResult result = solveHalley(residual, V_ic, options, "V_V");
    requireConvergence(result, "V_V");
    return result.root;
}

FloatArray sumDiodeAnodeCurrents(const IVData &ivData,
                                 const ModelParameters &params)
{
    const ParameterBatch p(
        params, broadcastShapes(ivData.I_A.shape(), ivData.V_V.shape()));
    return p.wrap(
        diodeAnodeCurrentSum(p, p.expand(ivData.I_A), p.expand(ivData.V_V)));
}

FloatArray currentAtVoltage(const FloatArray &V_V, const ModelParameters &params,
                            const SolverOptions &options)
{
    const ParameterBatch p(params, V_V.shape());
    return p.wrap(solveCurrent(p, p.expand(V_V), options));
}

FloatArray voltageAtCurrent(const FloatArray &I_A, const ModelParameters &params,
                            const SolverOptions &options)
{
    const ParameterBatch p(params, I_A.shape());
    return p.wrap(solveVoltage(p, p.expand(I_A), options));
}

CurrentSlope dIdVAtVoltage(const FloatArray &V_V, const ModelParameters &params,
                           const SolverOptions &options)
{
    const ParameterBatch p(params, V_V.shape());
    const Eigen::ArrayXd V = p.expand(V_V);
    const Eigen::ArrayXd I = solveCurrent(p, V, options);
    const CurrentDerivatives d = currentDerivatives(p, I, V);

    return CurrentSlope{p.wrap(d.dI_dV_S), p.wrap(I)};
}

CurrentCurvature d2IdV2AtVoltage(const FloatArray &V_V,
                                 const ModelParameters &params,
                                 const SolverOptions &options)
{
    const ParameterBatch p(params, V_V.shape());
    const Eigen::ArrayXd V = p.expand(V_V);
    const Eigen::ArrayXd I = solveCurrent(p, V, options);
    const CurrentDerivatives d = currentDerivatives(p, I, V);

    return CurrentCurvature{p.wrap(d.d2I_dV2_S_per_V), p.wrap(d.dI_dV_S),
                            p.wrap(I)};
}

VoltageSlope dVdIAtCurrent(const FloatArray &I_A, const ModelParameters &params,
                           const SolverOptions &options)
{
    const ParameterBatch p(params, I_A.shape());
    const Eigen::ArrayXd I = p.expand(I_A);
    const Eigen::ArrayXd V = solveVoltage(p, I, options);

    return VoltageSlope{p.wrap(voltageSlope(p, I, V)), p.wrap(V)};
}

PowerAtVoltage powerAtVoltage(const FloatArray &V_V,
                              const ModelParameters &params,
                              const SolverOptions &options)
{
    const ParameterBatch p(params, V_V.shape());
    const Eigen::ArrayXd V = p.expand(V_V);
    const Eigen::ArrayXd I = solveCurrent(p, V, options);

    return PowerAtVoltage{p.wrap(V * I), p.wrap(I)};
}
