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
 * @file SingleDiodeEquation.hpp
 * @brief Public API of the single-diode equation solver.
 *
 * Every function here is pure: it broadcasts its node input (if any) with
 * the seven model-parameter fields, solves every element of the resulting
 * batch independently, and returns arrays of that common shape. Either the
 * whole batch satisfies the equation to the solver tolerance or the call
 * throws; partial results are never returned.
 *
 * Failure modes:
 *  - ConvergenceError: any element failed to converge (see SolverErrors.hpp).
 *  - DomainError: voltage solves requested at a current on or beyond the
 *    short-circuit asymptote (I_ph + I_rs - I <= 0).
 *  - std::invalid_argument: incompatible shapes or invalid options.
 *
 * Dependency order: residual -> current/voltage solves -> derivatives and
 * power -> resistances -> maximum power point -> fill factor -> curve
 * parameters.
 *
 * Usage example:
 * @code
 * ModelParameters params(1.0, 25.0, 6.0, 1e-9, 1.0, 0.05, 0.001);
 * FloatArray I = currentAtVoltage(FloatArray(std::vector<double>{0.0, 0.3}),
 *                                 params);                // shape {2}
 * IVCurveParameters curve = ivCurveParameters(params);    // shape {}
 * double ff = curve.FF.item();
 * @endcode
 */

#pragma once

#include "FloatArray.hpp"
#include "ModelParameters.hpp"
#include "SolverOptions.hpp"

/** @brief dI/dV and the current it was evaluated at. */
struct CurrentSlope
{
    FloatArray dI_dV_S; /**< [S] */
    FloatArray I_A;     /**< [A] */
};

/** @brief d2I/dV2, dI/dV and the current they were evaluated at. */
struct CurrentCurvature
{
    FloatArray d2I_dV2_S_per_V; /**< [S/V] */
    FloatArray dI_dV_S;         /**< [S] */
    FloatArray I_A;             /**< [A] */
};

/** @brief dV/dI and the voltage it was evaluated at. */
struct VoltageSlope
{
    FloatArray dV_dI_Ohm; /**< [Ohm] */
    FloatArray V_V;       /**< [V] */
};

/** @brief Terminal power and current at a voltage. */
struct PowerAtVoltage
{
    FloatArray P_W; /**< [W] */
    FloatArray I_A; /**< [A] */
};

/** @brief Maximum power point and the open-circuit voltage. */
struct MaxPowerPoint
{
    FloatArray P_mp_W; /**< [W] */
    FloatArray I_mp_A; /**< [A] */
    FloatArray V_mp_V; /**< [V] */
    FloatArray V_oc_V; /**< [V] */
};

/** @brief Fill factor with the quantities it was computed from. */
struct FillFactor
{
    FloatArray FF;     /**< [.], NaN where I_sc * V_oc == 0 */
    FloatArray I_sc_A; /**< [A] */
    FloatArray I_mp_A; /**< [A] */
    FloatArray P_mp_W; /**< [W] */
    FloatArray V_mp_V; /**< [V] */
    FloatArray V_oc_V; /**< [V] */
};

/** @brief Terminal resistance at short circuit. */
struct ShortCircuitResistance
{
    FloatArray R_sc_Ohm; /**< [Ohm] */
    FloatArray I_sc_A;   /**< [A] */
};

/** @brief Terminal resistance at open circuit. */
struct OpenCircuitResistance
{
    FloatArray R_oc_Ohm; /**< [Ohm] */
    FloatArray V_oc_V;   /**< [V] */
};

/**
 * @brief Sum of currents at the diode's anode node [A].
 *
 * Zero exactly at a consistent operating point. Shape is the broadcast of
 * `ivData.I_A`, `ivData.V_V` and the model parameters.
 */
FloatArray sumDiodeAnodeCurrents(const IVData &ivData,
                                 const ModelParameters &params);

/**
 * @brief Terminal current at terminal voltage [A].
 *
 * Compute strategy:
 *  1) Explicit initial condition with R_s == 0 (exact when R_s is zero).
 *  2) Halley's method on the anode current sum with respect to current.
 */
FloatArray currentAtVoltage(const FloatArray &V_V, const ModelParameters &params,
                            const SolverOptions &options = SolverOptions());

/**
 * @brief Terminal voltage at terminal current [V].
 *
 * Compute strategy:
 *  1) Explicit initial condition with G_p == 0; throws DomainError if
 *     I_ph + I_rs - I <= 0 for any element.
 *  2) Halley's method on the anode current sum with respect to voltage.
 */
FloatArray voltageAtCurrent(const FloatArray &I_A, const ModelParameters &params,
                            const SolverOptions &options = SolverOptions());

/**
 * @brief dI/dV at terminal voltage, by implicit differentiation.
 *
 * Needed e.g. for the resistances at short and open circuit.
 */
CurrentSlope dIdVAtVoltage(const FloatArray &V_V, const ModelParameters &params,
                           const SolverOptions &options = SolverOptions());

/**
 * @brief d2I/dV2 (and dI/dV) at terminal voltage.
 *
 * With g_d = I_rs / n_mod * exp(V_d / n_mod) and
 * u = 1 / (1 + R_s * (g_d + G_p)), the curvature is the exact second
 * derivative of the implicit I(V):
 *
 *     d2I/dV2 = -(g_d / n_mod) * u^3
 *
 * Note the cube: a form with u^2 drops one chain-rule factor of dV_d/dV and
 * differs from this value whenever R_s > 0.
 */
CurrentCurvature d2IdV2AtVoltage(const FloatArray &V_V,
                                 const ModelParameters &params,
                                 const SolverOptions &options = SolverOptions());

/**
 * @brief dV/dI at terminal current.
 *
 * Needed e.g. when integrating a capacitor charged by the device.
 */
VoltageSlope dVdIAtCurrent(const FloatArray &I_A, const ModelParameters &params,
                           const SolverOptions &options = SolverOptions());

/** @brief Terminal power P = V * I(V) at terminal voltage. */
PowerAtVoltage powerAtVoltage(const FloatArray &V_V,
                              const ModelParameters &params,
                              const SolverOptions &options = SolverOptions());

/**
 * @brief Maximum terminal power.
 *
 * Compute strategy:
 *  1) V_oc from the voltage solve at I = 0.
 *  2) Initial condition V_mp = 0.75 * V_oc.
 *  3) Halley's method on dP/dV = 0 using closed-form d2P/dV2 and d3P/dV3.
 *  4) I_mp and P_mp at the converged V_mp.
 */
MaxPowerPoint maxPowerPoint(const ModelParameters &params,
                            const SolverOptions &options = SolverOptions());

/**
 * @brief Fill factor P_mp / (I_sc * V_oc).
 *
 * Element-wise NaN where I_sc * V_oc is exactly zero (e.g. I_ph == 0); the
 * rest of the batch is unaffected.
 */
FillFactor fillFactor(const ModelParameters &params,
                      const SolverOptions &options = SolverOptions());

/** @brief R_sc = -1 / (dI/dV at V = 0). */
ShortCircuitResistance resistanceAtShortCircuit(
    const ModelParameters &params,
    const SolverOptions &options = SolverOptions());

/** @brief R_oc = -1 / (dI/dV at V = V_oc). */
OpenCircuitResistance resistanceAtOpenCircuit(
    const ModelParameters &params,
    const SolverOptions &options = SolverOptions());

/**
 * @brief All I-V curve parameters, including the auxiliary points
 *        V_x = V_oc / 2 and V_xx = (V_mp + V_oc) / 2.
 */
IVCurveParameters ivCurveParameters(
    const ModelParameters &params,
    const SolverOptions &options = SolverOptions());
