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
 * @file Residual.cpp
 * @brief Closed-form residual, Jacobians and initial guesses of the SDE.
 *
 * The residual uses expm1 so that the trivial operating point of an unlit
 * device (I_ph = 0, I = 0, V = 0) gives an exactly zero current sum, and so
 * that the R_s == 0 initial guess is bit-identical to the residual's own
 * closed form.
 */

#include "SingleDiodeResidual.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "Constants.hpp"
#include "SolverErrors.hpp"

ParameterBatch::ParameterBatch(const ModelParameters &params,
                               const Shape &nodeShape)
    : shape(broadcastShapes(params.shape(), nodeShape)),
      N_s(broadcastTo(params.N_s, shape)),
      T_degC(broadcastTo(params.T_degC, shape)),
      I_ph_A(broadcastTo(params.I_ph_A, shape)),
      I_rs_A(broadcastTo(params.I_rs_A, shape)),
      n(broadcastTo(params.n, shape)),
      R_s_Ohm(broadcastTo(params.R_s_Ohm, shape)),
      G_p_S(broadcastTo(params.G_p_S, shape)),
      n_mod_V(n * scaledThermalVoltage(N_s, T_degC))
{
}

Eigen::ArrayXd ParameterBatch::expand(const FloatArray &node) const
{
    return broadcastTo(node, shape);
}

FloatArray ParameterBatch::wrap(const Eigen::ArrayXd &values) const
{
    return FloatArray(shape, values);
}

namespace
{
Eigen::ArrayXd gather(const Eigen::ArrayXd &values,
                      const std::vector<Eigen::Index> &indices)
{
    Eigen::ArrayXd out(static_cast<Eigen::Index>(indices.size()));
    for (size_t k = 0; k < indices.size(); ++k)
        out[static_cast<Eigen::Index>(k)] = values[indices[k]];
    return out;
}
}  // namespace

ParameterBatch ParameterBatch::subset(
    const std::vector<Eigen::Index> &indices) const
{
    for (Eigen::Index i : indices) {
        if (i < 0 || i >= size())
            throw std::out_of_range("batch index out of range");
    }

    ParameterBatch sub = *this;
    sub.shape = Shape{static_cast<Eigen::Index>(indices.size())};
    sub.N_s = gather(N_s, indices);
    sub.T_degC = gather(T_degC, indices);
    sub.I_ph_A = gather(I_ph_A, indices);
    sub.I_rs_A = gather(I_rs_A, indices);
    sub.n = gather(n, indices);
    sub.R_s_Ohm = gather(R_s_Ohm, indices);
    sub.G_p_S = gather(G_p_S, indices);
    sub.n_mod_V = gather(n_mod_V, indices);
    return sub;
}

Eigen::ArrayXd diodeAnodeCurrentSum(const ParameterBatch &p,
                                    const Eigen::ArrayXd &I_A,
                                    const Eigen::ArrayXd &V_V)
{
    const Eigen::ArrayXd V_diode_V = V_V + I_A * p.R_s_Ohm;
    return p.I_ph_A - p.I_rs_A * (V_diode_V / p.n_mod_V).expm1() -
           p.G_p_S * V_diode_V - I_A;
}

HalleyEvaluation residualInCurrent(const ParameterBatch &p,
                                   const Eigen::ArrayXd &I_A,
                                   const Eigen::ArrayXd &V_V)
{
    const Eigen::ArrayXd expTerm =
        ((V_V + I_A * p.R_s_Ohm) / p.n_mod_V).exp();
    const Eigen::ArrayXd rsOverN = p.R_s_Ohm / p.n_mod_V;

    HalleyEvaluation ev;
    ev.f = diodeAnodeCurrentSum(p, I_A, V_V);
    ev.fprime = -p.I_rs_A * rsOverN * expTerm - p.G_p_S * p.R_s_Ohm - 1.0;
    ev.fprime2 = -p.I_rs_A * rsOverN.square() * expTerm;
    return ev;
}

HalleyEvaluation residualInVoltage(const ParameterBatch &p,
                                   const Eigen::ArrayXd &I_A,
                                   const Eigen::ArrayXd &V_V)
{
    const Eigen::ArrayXd expTerm =
        ((V_V + I_A * p.R_s_Ohm) / p.n_mod_V).exp();

    HalleyEvaluation ev;
    ev.f = diodeAnodeCurrentSum(p, I_A, V_V);
    ev.fprime = -p.I_rs_A / p.n_mod_V * expTerm - p.G_p_S;
    ev.fprime2 = -p.I_rs_A / p.n_mod_V.square() * expTerm;
    return ev;
}

Eigen::ArrayXd currentInitialCondition(const ParameterBatch &p,
                                       const Eigen::ArrayXd &V_V)
{
    return p.I_ph_A - p.I_rs_A * (V_V / p.n_mod_V).expm1() - p.G_p_S * V_V;
}

Eigen::ArrayXd voltageInitialCondition(const ParameterBatch &p,
                                       const Eigen::ArrayXd &I_A)
{
    const Eigen::ArrayXd logArg = p.I_ph_A + p.I_rs_A - I_A;

    for (Eigen::Index i = 0; i < p.size(); ++i) {
        // Written as !(x > 0) so NaN is rejected too.
        if (!(logArg[i] > 0.0) || !(p.I_rs_A[i] > 0.0)) {
            std::ostringstream msg;
            msg << "voltage initial condition out of domain at flat index " << i
                << ": requires I_ph_A + I_rs_A - I_A > 0 and I_rs_A > 0, got "
                << "I_ph_A + I_rs_A - I_A = " << logArg[i]
                << ", I_rs_A = " << p.I_rs_A[i];
            throw DomainError(msg.str());
        }
    }

    return p.n_mod_V * (logArg.log() - p.I_rs_A.log()) - I_A * p.R_s_Ohm;
}

CurrentDerivatives currentDerivatives(const ParameterBatch &p,
                                      const Eigen::ArrayXd &I_A,
                                      const Eigen::ArrayXd &V_V)
{
    // Diode small-signal conductance at the operating point.
    const Eigen::ArrayXd gDiode =
        p.I_rs_A / p.n_mod_V * ((V_V + I_A * p.R_s_Ohm) / p.n_mod_V).exp();
    const Eigen::ArrayXd u = 1.0 / (1.0 + p.R_s_Ohm * (gDiode + p.G_p_S));

    CurrentDerivatives d;
    d.dI_dV_S = -(gDiode + p.G_p_S) * u;
    d.d2I_dV2_S_per_V = -gDiode / p.n_mod_V * u.cube();
    d.d3I_dV3_S_per_V2 =
        -gDiode / p.n_mod_V.square() * u.square().square() -
        3.0 * gDiode / p.n_mod_V * u.square() * p.R_s_Ohm * d.d2I_dV2_S_per_V;
    return d;
}

Eigen::ArrayXd voltageSlope(const ParameterBatch &p, const Eigen::ArrayXd &I_A,
                            const Eigen::ArrayXd &V_V)
{
    const Eigen::ArrayXd gDiode =
        p.I_rs_A / p.n_mod_V * ((V_V + I_A * p.R_s_Ohm) / p.n_mod_V).exp();
    return -1.0 / (gDiode + p.G_p_S) - p.R_s_Ohm;
}
