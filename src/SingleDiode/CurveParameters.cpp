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
 * @file CurveParameters.cpp
 * @brief Maximum power point, fill factor, resistances and the I-V curve
 *        parameter aggregate.
 *
 * The batch-level helpers in this file work on one `ParameterBatch` so that
 * `ivCurveParameters` computes I_sc, V_oc and the maximum power point once
 * and reuses them; the results are identical to calling the individual
 * public functions because every solve is deterministic.
 */

#include <Eigen/Dense>
#include <limits>
#include <string>
#include <vector>

#include "HalleySolver.hpp"
#include "SingleDiodeEquation.hpp"
#include "SingleDiodeResidual.hpp"
#include "SolverErrors.hpp"

namespace
{
struct MaxPowerBatch
{
    Eigen::ArrayXd P_mp_W;
    Eigen::ArrayXd I_mp_A;
    Eigen::ArrayXd V_mp_V;
    Eigen::ArrayXd V_oc_V;
};

// Initial guess for V_mp as a fraction of V_oc (knee of a typical curve).
constexpr double V_MP_IC_FRACTION = 0.75;

// dP/dV changes sign on [0, V_oc]: P'(0) = I_sc > 0 and
// P'(V_oc) = V_oc I'(V_oc) < 0 for a lit device.
MaxPowerBatch solveMaxPower(const ParameterBatch &p,
                            const SolverOptions &options)
{
    MaxPowerBatch mp;
    mp.V_oc_V = solveVoltage(p, Eigen::ArrayXd::Zero(p.size()), options);

    // P = V I(V), so with I', I'', I''' from implicit differentiation:
    //   P' = I + V I',  P'' = 2 I' + V I'',  P''' = 3 I'' + V I'''.
    HalleySubsetFunction dPdV = [&p, &options](
                                    const Eigen::ArrayXd &V_V,
                                    const std::vector<Eigen::Index> &indices) {
        const ParameterBatch active = p.subset(indices);
        const Eigen::ArrayXd I_A = solveCurrent(active, V_V, options);
        const CurrentDerivatives d = currentDerivatives(active, I_A, V_V);

        HalleyEvaluation ev;
        ev.f = I_A + V_V * d.dI_dV_S;
        ev.fprime = 2.0 * d.dI_dV_S + V_V * d.d2I_dV2_S_per_V;
        ev.fprime2 = 3.0 * d.d2I_dV2_S_per_V + V_V * d.d3I_dV3_S_per_V2;
        return ev;
    };

    HalleyResult result;
    try {
        result = solveHalleyBracketed(
            dPdV, V_MP_IC_FRACTION * mp.V_oc_V, Eigen::ArrayXd::Zero(p.size()),
            mp.V_oc_V, options, "V_mp_V");
    } catch (const ConvergenceError &e) {
        throw ConvergenceError(std::string("V_mp_V: ") + e.what());
    }
    requireConvergence(result, "V_mp_V");

    mp.V_mp_V = result.root;
    mp.I_mp_A = solveCurrent(p, mp.V_mp_V, options);
    mp.P_mp_W = mp.I_mp_A * mp.V_mp_V;
    return mp;
}

Eigen::ArrayXd fillFactorFrom(const Eigen::ArrayXd &P_mp_W,
                              const Eigen::ArrayXd &I_sc_A,
                              const Eigen::ArrayXd &V_oc_V)
{
    const Eigen::ArrayXd denominator = I_sc_A * V_oc_V;
    return (denominator != 0.0)
        .select(P_mp_W / denominator,
                Eigen::ArrayXd::Constant(
                    denominator.size(),
                    std::numeric_limits<double>::quiet_NaN()));
}

// -1 / (dI/dV) at the operating point (I, V).
Eigen::ArrayXd resistanceAt(const ParameterBatch &p, const Eigen::ArrayXd &I_A,
                            const Eigen::ArrayXd &V_V)
{
    return -1.0 / currentDerivatives(p, I_A, V_V).dI_dV_S;
}
}  // namespace

MaxPowerPoint maxPowerPoint(const ModelParameters &params,
                            const SolverOptions &options)
{
    const ParameterBatch p(params, Shape());
    const MaxPowerBatch mp = solveMaxPower(p, options);

    return MaxPowerPoint{p.wrap(mp.P_mp_W), p.wrap(mp.I_mp_A),
                         p.wrap(mp.V_mp_V), p.wrap(mp.V_oc_V)};
}

FillFactor fillFactor(const ModelParameters &params,
                      const SolverOptions &options)
{
    const ParameterBatch p(params, Shape());
    const Eigen::ArrayXd I_sc_A =
        solveCurrent(p, Eigen::ArrayXd::Zero(p.size()), options);
    const MaxPowerBatch mp = solveMaxPower(p, options);

    return FillFactor{p.wrap(fillFactorFrom(mp.P_mp_W, I_sc_A, mp.V_oc_V)),
                      p.wrap(I_sc_A),
                      p.wrap(mp.I_mp_A),
                      p.wrap(mp.P_mp_W),
                      p.wrap(mp.V_mp_V),
                      p.wrap(mp.V_oc_V)};
}

ShortCircuitResistance resistanceAtShortCircuit(const ModelParameters &params,
                                                const SolverOptions &options)
{
    const ParameterBatch p(params, Shape());
    const Eigen::ArrayXd V_V = Eigen::ArrayXd::Zero(p.size());
    const Eigen::ArrayXd I_sc_A = solveCurrent(p, V_V, options);

    return ShortCircuitResistance{p.wrap(resistanceAt(p, I_sc_A, V_V)),
                                  p.wrap(I_sc_A)};
}

OpenCircuitResistance resistanceAtOpenCircuit(const ModelParameters &params,
                                              const SolverOptions &options)
{
    const ParameterBatch p(params, Shape());
    const Eigen::ArrayXd V_oc_V =
        solveVoltage(p, Eigen::ArrayXd::Zero(p.size()), options);
    const Eigen::ArrayXd I_A = solveCurrent(p, V_oc_V, options);

    return OpenCircuitResistance{p.wrap(resistanceAt(p, I_A, V_oc_V)),
                                 p.wrap(V_oc_V)};
}

IVCurveParameters ivCurveParameters(const ModelParameters &params,
                                    const SolverOptions &options)
{
    const ParameterBatch p(params, Shape());
    const Eigen::ArrayXd zeros = Eigen::ArrayXd::Zero(p.size());

    const Eigen::ArrayXd I_sc_A = solveCurrent(p, zeros, options);
    const MaxPowerBatch mp = solveMaxPower(p, options);

    const Eigen::ArrayXd V_x_V = mp.V_oc_V / 2.0;
    const Eigen::ArrayXd I_x_A = solveCurrent(p, V_x_V, options);

    const Eigen::ArrayXd V_xx_V = (mp.V_mp_V + mp.V_oc_V) / 2.0;
    const Eigen::ArrayXd I_xx_A = solveCurrent(p, V_xx_V, options);

    const Eigen::ArrayXd I_oc_A = solveCurrent(p, mp.V_oc_V, options);

    IVCurveParameters curve{
        p.wrap(I_sc_A),
        p.wrap(resistanceAt(p, I_sc_A, zeros)),
        p.wrap(V_x_V),
        p.wrap(I_x_A),
        p.wrap(mp.I_mp_A),
        p.wrap(mp.P_mp_W),
        p.wrap(mp.V_mp_V),
        p.wrap(V_xx_V),
        p.wrap(I_xx_A),
        p.wrap(resistanceAt(p, I_oc_A, mp.V_oc_V)),
        p.wrap(mp.V_oc_V),
        p.wrap(fillFactorFrom(mp.P_mp_W, I_sc_A, mp.V_oc_V)),
    };
    return curve;
}
