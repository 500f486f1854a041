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
 * @file HalleySolver.hpp
 * @brief Batched Halley root finder with per-element convergence tracking.
 *
 * The solver drives many independent scalar root-finding problems at once.
 * A single callback evaluates f, f' and f'' for the whole batch so that
 * shared sub-expressions (typically one exponential per element) are
 * computed once per iteration. Each element is updated with
 *
 *     dx = (f / f') / (1 - f f'' / (2 f'^2))
 *
 * where the Halley correction is applied only when |f f'' / (2 f'^2)| < 1;
 * otherwise the plain Newton step f / f' is taken. An element stops when
 *  - f is exactly zero (converged),
 *  - |dx| <= tolAbs + tolRel * |x| after an update (converged),
 *  - f' is zero, or f, f' or the new iterate is non-finite (failed),
 *  - `maxIters` updates were made without converging (failed).
 * Stopped elements are frozen, so the iterate sequence of every element is
 * exactly the one an independent scalar solve would produce.
 *
 * `solveHalleyBracketed` adds a per-element sign-change bracket: the bracket
 * shrinks with every evaluation, and any update that would leave it (or that
 * cannot be formed) is replaced by a bisection step. Its callback only sees
 * the elements that are still iterating.
 *
 * Usage example:
 * @code
 * HalleyFunction sq = [](const Eigen::ArrayXd &x) {
 *     return HalleyEvaluation{x * x - 2.0, 2.0 * x,
 *                             Eigen::ArrayXd::Constant(x.size(), 2.0)};
 * };
 * HalleyResult r = solveHalley(sq, Eigen::ArrayXd::Constant(4, 1.0),
 *                              SolverOptions(), "sqrt2");
 * requireConvergence(r, "sqrt2");   // throws ConvergenceError on failure
 * @endcode
 */

#pragma once

#include <Eigen/Dense>
#include <functional>
#include <string>
#include <vector>

#include "SolverOptions.hpp"

/**
 * @struct HalleyEvaluation
 * @brief Function value and first two derivatives over a batch.
 *
 * All three arrays must have the size of the iterate passed to the
 * callback. `fprime2` may contain non-finite entries; the affected elements
 * then take a Newton step.
 */
struct HalleyEvaluation
{
    Eigen::ArrayXd f;
    Eigen::ArrayXd fprime;
    Eigen::ArrayXd fprime2;
};

/** @brief Batch callback: iterate -> (f, f', f''). */
using HalleyFunction =
    std::function<HalleyEvaluation(const Eigen::ArrayXd &x)>;

/**
 * @brief Callback over a subset of the batch.
 *
 * `x[k]` is the iterate of batch element `indices[k]`; the returned arrays
 * have the size of `x`.
 */
using HalleySubsetFunction = std::function<HalleyEvaluation(
    const Eigen::ArrayXd &x, const std::vector<Eigen::Index> &indices)>;

/**
 * @enum HalleyStatus
 * @brief Final state of one element of a batched solve.
 */
enum class HalleyStatus
{
    CONVERGED,       /**< Residual zero or update within tolerance. */
    MAX_ITERS,       /**< Iteration limit reached. */
    ZERO_DERIVATIVE, /**< f' vanished; no update possible. */
    NON_FINITE,      /**< f, f' or the next iterate was Inf/NaN. */
    NOT_BRACKETED    /**< f has the same sign at both bracket ends. */
};

/** @brief Short human-readable name of a status. */
const char *toString(HalleyStatus status);

/**
 * @struct HalleyResult
 * @brief Per-element outcome of `solveHalley`.
 */
struct HalleyResult
{
    Eigen::ArrayXd root;      /**< Last accepted iterate. */
    Eigen::ArrayXd residual;  /**< f at the last evaluation. */
    Eigen::ArrayXi iterations; /**< Updates applied per element. */
    std::vector<HalleyStatus> status;

    bool allConverged() const;
    Eigen::Index failedCount() const;
};

/**
 * @brief Run Halley's method on every element of `x0`.
 *
 * Never throws for non-convergence; inspect the result or call
 * `requireConvergence`. When `options.diagFile` is set a summary line, one
 * line per failing element and, with `diagVerbose`, an iteration trace are
 * appended to that file.
 *
 * @param fn Batch callback returning f, f', f''.
 * @param x0 Initial iterate (one entry per element).
 * @param options Tolerances, iteration limit and diagnostics settings.
 * @param label Name of the solved quantity, used in diagnostics.
 * @return Per-element roots and status.
 *
 * Throws std::invalid_argument if the callback returns arrays of the wrong
 * size.
 */
HalleyResult solveHalley(const HalleyFunction &fn, const Eigen::ArrayXd &x0,
                         const SolverOptions &options,
                         const std::string &label);

/**
 * @brief Halley's method safeguarded by a sign-change bracket.
 *
 * f is first evaluated at both bracket ends. An element whose f is
 * exactly zero at an end converges there; one whose f has the same sign at
 * both ends is reported as NOT_BRACKETED. For the others the iterate starts
 * at `x0` (or at the midpoint when `x0` lies outside the bracket) and each
 * evaluation moves one end of the bracket onto the iterate. A Halley update
 * that is non-finite, needs a zero f', or does not land strictly inside the
 * bracket is replaced by bisection. An element converges when its update or
 * its bracket width is within `tolAbs + tolRel * |x|`.
 *
 * Only elements still iterating are passed to `fn`. The end-point
 * evaluations cover the whole batch.
 *
 * @param fn Subset callback returning f, f', f''.
 * @param x0 Initial iterate (one entry per element).
 * @param lower One bracket end per element.
 * @param upper Other bracket end per element; the ends may come in either
 *        order.
 * @param options Tolerances, iteration limit and diagnostics settings.
 * @param label Name of the solved quantity, used in diagnostics.
 * @return Per-element roots and status.
 *
 * Throws std::invalid_argument on mismatched input sizes or a callback
 * result of the wrong size.
 */
HalleyResult solveHalleyBracketed(const HalleySubsetFunction &fn,
                                  const Eigen::ArrayXd &x0,
                                  const Eigen::ArrayXd &lower,
                                  const Eigen::ArrayXd &upper,
                                  const SolverOptions &options,
                                  const std::string &label);

/**
 * @brief Enforce the all-or-nothing convergence policy.
 *
 * Throws ConvergenceError if any element did not converge. The message names
 * `label`, the number of failed elements and the first failure.
 */
void requireConvergence(const HalleyResult &result, const std::string &label);
