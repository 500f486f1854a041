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
 * @file SingleDiodeResidual.hpp
 * @brief Residual of the single-diode equation and its closed-form derivatives.
 *
 * The single-diode equation (SDE) is written as a current balance at the
 * diode's anode node:
 *
 *     I_sum = I_ph - I_rs * (exp(V_d / n_mod) - 1) - G_p * V_d - I
 *     V_d   = V + I * R_s
 *     n_mod = n * N_s * k_B * T_K / q
 *
 * which is zero exactly at a physically consistent (I, V) operating point.
 * This header provides the residual, its first and second derivatives with
 * respect to either terminal quantity (for the root finder), the analytic
 * initial guesses, the derivatives of I(V) obtained by implicit
 * differentiation, and the two flat-batch solves built on them. The public,
 * shape-aware entry points are in SingleDiodeEquation.hpp.
 *
 * All functions operate on a `ParameterBatch`: the model parameters
 * broadcast once to the common shape of a call and flattened.
 */

#pragma once

#include <Eigen/Dense>
#include <vector>

#include "FloatArray.hpp"
#include "HalleySolver.hpp"
#include "ModelParameters.hpp"
#include "SolverOptions.hpp"

/**
 * @struct ParameterBatch
 * @brief Model parameters broadcast to one shape and flattened.
 *
 * Built at every public function boundary. `n_mod_V` caches the modified
 * ideality factor n * N_s * k_B * T_K / q.
 */
struct ParameterBatch
{
    /**
     * @brief Broadcast `params` together with an input of shape `nodeShape`.
     *
     * Throws std::invalid_argument on incompatible shapes.
     */
    ParameterBatch(const ModelParameters &params, const Shape &nodeShape);

    Shape shape;
    Eigen::ArrayXd N_s;
    Eigen::ArrayXd T_degC;
    Eigen::ArrayXd I_ph_A;
    Eigen::ArrayXd I_rs_A;
    Eigen::ArrayXd n;
    Eigen::ArrayXd R_s_Ohm;
    Eigen::ArrayXd G_p_S;
    Eigen::ArrayXd n_mod_V;

    Eigen::Index size() const { return n_mod_V.size(); }

    /** @brief Broadcast an input array to the batch shape. */
    Eigen::ArrayXd expand(const FloatArray &node) const;

    /** @brief Wrap flat batch values back into the batch shape. */
    FloatArray wrap(const Eigen::ArrayXd &values) const;

    /**
     * @brief The elements at flat `indices`, as a 1-d batch.
     *
     * Throws std::out_of_range on an index outside the batch.
     */
    ParameterBatch subset(const std::vector<Eigen::Index> &indices) const;
};

/**
 * @brief Sum of currents at the diode anode, I_sum(I, V) [A].
 */
Eigen::ArrayXd diodeAnodeCurrentSum(const ParameterBatch &p,
                                    const Eigen::ArrayXd &I_A,
                                    const Eigen::ArrayXd &V_V);

/**
 * @brief I_sum and its 1st/2nd derivatives with respect to current.
 *
 *     dI_sum/dI   = -I_rs R_s / n_mod exp(V_d / n_mod) - G_p R_s - 1
 *     d2I_sum/dI2 = -I_rs (R_s / n_mod)^2 exp(V_d / n_mod)
 */
HalleyEvaluation residualInCurrent(const ParameterBatch &p,
                                   const Eigen::ArrayXd &I_A,
                                   const Eigen::ArrayXd &V_V);

/**
 * @brief I_sum and its 1st/2nd derivatives with respect to voltage.
 *
 *     dI_sum/dV   = -I_rs / n_mod exp(V_d / n_mod) - G_p
 *     d2I_sum/dV2 = -I_rs / n_mod^2 exp(V_d / n_mod)
 */
HalleyEvaluation residualInVoltage(const ParameterBatch &p,
                                   const Eigen::ArrayXd &I_A,
                                   const Eigen::ArrayXd &V_V);

/**
 * @brief Explicit current at voltage assuming R_s == 0.
 *
 * Exact when R_s is zero; otherwise the starting point of the current solve.
 */
Eigen::ArrayXd currentInitialCondition(const ParameterBatch &p,
                                       const Eigen::ArrayXd &V_V);

/**
 * @brief Explicit voltage at current assuming G_p == 0.
 *
 *     V_ic = n_mod (ln(I_ph + I_rs - I) - ln(I_rs)) - I R_s
 *
 * Throws DomainError if I_ph + I_rs - I <= 0 or I_rs <= 0 (or either is
 * NaN) for any element.
 */
Eigen::ArrayXd voltageInitialCondition(const ParameterBatch &p,
                                       const Eigen::ArrayXd &I_A);

/**
 * @struct CurrentDerivatives
 * @brief Derivatives of the terminal current with respect to voltage.
 */
struct CurrentDerivatives
{
    Eigen::ArrayXd dI_dV_S;          /**< [S] */
    Eigen::ArrayXd d2I_dV2_S_per_V;  /**< [S/V] */
    Eigen::ArrayXd d3I_dV3_S_per_V2; /**< [S/V^2] */
};

/**
 * @brief dI/dV, d2I/dV2 and d3I/dV3 at an operating point (I, V).
 *
 * Implicit differentiation of I_sum(I(V), V) = 0. With
 * g = I_rs / n_mod exp(V_d / n_mod) + G_p and u = 1 / (1 + R_s g):
 *
 *     dI/dV   = -g u
 *     d2I/dV2 = -(I_rs / n_mod^2) exp(V_d / n_mod) u^3
 *     d3I/dV3 = -(I_rs / n_mod^3) exp(V_d / n_mod) u^4
 *               - 3 (I_rs / n_mod^2) exp(V_d / n_mod) u^2 R_s d2I/dV2
 *
 * `I_A` must satisfy the SDE at `V_V`.
 */
CurrentDerivatives currentDerivatives(const ParameterBatch &p,
                                      const Eigen::ArrayXd &I_A,
                                      const Eigen::ArrayXd &V_V);

/**
 * @brief dV/dI at an operating point (I, V) [Ohm].
 *
 *     dV/dI = -1 / (I_rs / n_mod exp(V_d / n_mod) + G_p) - R_s
 */
Eigen::ArrayXd voltageSlope(const ParameterBatch &p, const Eigen::ArrayXd &I_A,
                            const Eigen::ArrayXd &V_V);

/**
 * @brief Terminal current at terminal voltage for a flat batch.
 *
 * Starts from `currentInitialCondition` and refines with Halley's method on
 * `residualInCurrent`. Throws ConvergenceError if any element fails.
 */
Eigen::ArrayXd solveCurrent(const ParameterBatch &p, const Eigen::ArrayXd &V_V,
                            const SolverOptions &options);

/**
 * @brief Terminal voltage at terminal current for a flat batch.
 *
 * Starts from `voltageInitialCondition` (DomainError propagates before any
 * iteration) and refines with Halley's method on `residualInVoltage`.
 * Throws ConvergenceError if any element fails.
 */
Eigen::ArrayXd solveVoltage(const ParameterBatch &p, const Eigen::ArrayXd &I_A,
                            const SolverOptions &options);
