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
 * @file HalleySolver.cpp
 * @brief Implementation of the batched Halley iterations.
 *
 * Implementation notes:
 *  - `solveHalley` always evaluates the callback on the full batch; frozen
 *    elements simply ignore their entries.
 *  - `solveHalleyBracketed` gathers the iterates of the active elements and
 *    passes their batch indices, so callbacks with nested solves only redo
 *    the work for elements still iterating.
 *  - A non-finite candidate iterate is never committed, so `root` always
 *    holds the last finite iterate of a failed element for diagnostics.
 */

#include "HalleySolver.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "SolverErrors.hpp"

const char *toString(HalleyStatus status)
{
    switch (status) {
        case HalleyStatus::CONVERGED:
            return "converged";
        case HalleyStatus::MAX_ITERS:
            return "iteration limit reached";
        case HalleyStatus::ZERO_DERIVATIVE:
            return "zero derivative";
        case HalleyStatus::NON_FINITE:
            return "non-finite value";
        case HalleyStatus::NOT_BRACKETED:
            return "root not bracketed";
    }
    return "unknown";
}

namespace
{
HalleyResult startResult(const Eigen::ArrayXd &x0)
{
    const Eigen::Index size = x0.size();

    HalleyResult result;
    result.root = x0;
    result.residual = Eigen::ArrayXd::Constant(
        size, std::numeric_limits<double>::quiet_NaN());
    result.iterations = Eigen::ArrayXi::Zero(size);
    result.status.assign(static_cast<size_t>(size), HalleyStatus::MAX_ITERS);
    return result;
}

void openDiagnostics(std::ofstream &diag, const SolverOptions &options)
{
    if (options.diagFile.empty()) return;
    diag.open(options.diagFile, std::ios::app);
    diag.setf(std::ios::scientific);
    diag << std::setprecision(10);
}

void checkEvaluation(const HalleyEvaluation &ev, Eigen::Index size,
                     const std::string &label)
{
    if (ev.f.size() != size || ev.fprime.size() != size ||
        ev.fprime2.size() != size)
        throw std::invalid_argument(label +
                                    ": callback returned wrong batch size");
}

// Summary line, plus one line per failed element.
void writeSummary(std::ofstream &diag, const HalleyResult &result, int iter,
                  const std::string &label)
{
    if (!diag.is_open()) return;

    const Eigen::Index size = result.root.size();
    const Eigen::Index failed = result.failedCount();
    diag << label << ": size=" << size << " iterations=" << iter
         << " failed=" << failed << "\n";
    if (failed == 0) return;

    for (Eigen::Index i = 0; i < size; ++i) {
        const HalleyStatus s = result.status[static_cast<size_t>(i)];
        if (s == HalleyStatus::CONVERGED) continue;
        diag << "  [" << i << "] " << toString(s) << " x=" << result.root[i]
             << " f=" << result.residual[i]
             << " iters=" << result.iterations[i] << "\n";
    }
}
}  // namespace

bool HalleyResult::allConverged() const { return failedCount() == 0; }

Eigen::Index HalleyResult::failedCount() const
{
    Eigen::Index failed = 0;
    for (HalleyStatus s : status)
        if (s != HalleyStatus::CONVERGED) ++failed;
    return failed;
}

HalleyResult solveHalley(const HalleyFunction &fn, const Eigen::ArrayXd &x0,
                         const SolverOptions &options,
                         const std::string &label)
{
    const Eigen::Index size = x0.size();
    HalleyResult result = startResult(x0);

    std::vector<bool> active(static_cast<size_t>(size), true);
    Eigen::Index activeCount = size;

    std::ofstream diag;
    openDiagnostics(diag, options);

    int iter = 0;
    for (; iter < options.maxIters && activeCount > 0; ++iter) {
        const HalleyEvaluation ev = fn(result.root);
        checkEvaluation(ev, size, label);

        double maxStep = 0.0;
        for (Eigen::Index i = 0; i < size; ++i) {
            const size_t k = static_cast<size_t>(i);
            if (!active[k]) continue;

            const double f = ev.f[i];
            result.residual[i] = f;

            // Exact root: nothing left to do for this element.
            if (f == 0.0) {
                result.status[k] = HalleyStatus::CONVERGED;
                active[k] = false;
                --activeCount;
                continue;
            }

            const double fp = ev.fprime[i];
            if (!std::isfinite(f) || !std::isfinite(fp)) {
                result.status[k] = HalleyStatus::NON_FINITE;
                active[k] = false;
                --activeCount;
                continue;
            }
            if (fp == 0.0) {
                result.status[k] = HalleyStatus::ZERO_DERIVATIVE;
                active[k] = false;
                --activeCount;
                continue;
            }

            double step = f / fp;
            const double fpp = ev.fprime2[i];
            if (std::isfinite(fpp)) {
                const double adj = 0.5 * step * fpp / fp;
                if (std::abs(adj) < 1.0) step /= (1.0 - adj);
            }

            const double next = result.root[i] - step;
            if (!std::isfinite(next)) {
                result.status[k] = HalleyStatus::NON_FINITE;
                active[k] = false;
                --activeCount;
                continue;
            }

            result.root[i] = next;
            result.iterations[i] += 1;
            maxStep = std::max(maxStep, std::abs(step));

            if (std::abs(step) <= options.tolAbs + options.tolRel * std::abs(next)) {
                result.status[k] = HalleyStatus::CONVERGED;
                active[k] = false;
                --activeCount;
            }
        }

        if (diag.is_open() && options.diagVerbose)
            diag << label << " iter " << (iter + 1) << ": active=" << activeCount
                 << " maxStep=" << maxStep << "\n";
    }

    writeSummary(diag, result, iter, label);
    return result;
}

HalleyResult solveHalleyBracketed(const HalleySubsetFunction &fn,
                                  const Eigen::ArrayXd &x0,
                                  const Eigen::ArrayXd &lower,
                                  const Eigen::ArrayXd &upper,
                                  const SolverOptions &options,
                                  const std::string &label)
{
    const Eigen::Index size = x0.size();
    if (lower.size() != size || upper.size() != size)
        throw std::invalid_argument(label + ": bracket size does not match x0");

    HalleyResult result = startResult(x0);
    Eigen::ArrayXd lo = lower.min(upper);
    Eigen::ArrayXd hi = lower.max(upper);

    std::ofstream diag;
    openDiagnostics(diag, options);

    std::vector<Eigen::Index> all(static_cast<size_t>(size));
    for (Eigen::Index i = 0; i < size; ++i) all[static_cast<size_t>(i)] = i;

    const HalleyEvaluation atLo = fn(lo, all);
    checkEvaluation(atLo, size, label);
    const HalleyEvaluation atHi = fn(hi, all);
    checkEvaluation(atHi, size, label);

    // Sign of f at `lo`; each evaluation replaces the end with the same sign.
    std::vector<bool> positiveAtLo(static_cast<size_t>(size), false);
    std::vector<Eigen::Index> active;
    for (Eigen::Index i = 0; i < size; ++i) {
        const size_t k = static_cast<size_t>(i);
        const double fLo = atLo.f[i], fHi = atHi.f[i];

        if (fLo == 0.0 || fHi == 0.0) {
            result.root[i] = fLo == 0.0 ? lo[i] : hi[i];
            result.residual[i] = 0.0;
            result.status[k] = HalleyStatus::CONVERGED;
        } else if (!std::isfinite(fLo) || !std::isfinite(fHi)) {
            result.residual[i] = std::isfinite(fLo) ? fHi : fLo;
            result.status[k] = HalleyStatus::NON_FINITE;
        } else if ((fLo > 0.0) == (fHi > 0.0)) {
            result.residual[i] = fLo;
            result.status[k] = HalleyStatus::NOT_BRACKETED;
        } else {
            positiveAtLo[k] = fLo > 0.0;
            if (!(x0[i] >= lo[i] && x0[i] <= hi[i]))
                result.root[i] = 0.5 * (lo[i] + hi[i]);
            active.push_back(i);
        }
    }

    int iter = 0;
    for (; iter < options.maxIters && !active.empty(); ++iter) {
        const Eigen::Index count = static_cast<Eigen::Index>(active.size());
        Eigen::ArrayXd x(count);
        for (Eigen::Index j = 0; j < count; ++j)
            x[j] = result.root[active[static_cast<size_t>(j)]];

        const HalleyEvaluation ev = fn(x, active);
        checkEvaluation(ev, count, label);

        std::vector<Eigen::Index> stillActive;
        int bisections = 0;
        double maxStep = 0.0;
        for (Eigen::Index j = 0; j < count; ++j) {
            const Eigen::Index i = active[static_cast<size_t>(j)];
            const size_t k = static_cast<size_t>(i);

            const double f = ev.f[j];
            result.residual[i] = f;

            if (f == 0.0) {
                result.status[k] = HalleyStatus::CONVERGED;
                continue;
            }
            if (!std::isfinite(f)) {
                result.status[k] = HalleyStatus::NON_FINITE;
                continue;
            }

            if ((f > 0.0) == positiveAtLo[k])
                lo[i] = x[j];
            else
                hi[i] = x[j];

            const double fp = ev.fprime[j];
            double step = std::numeric_limits<double>::quiet_NaN();
            if (std::isfinite(fp) && fp != 0.0) {
                step = f / fp;
                const double fpp = ev.fprime2[j];
                if (std::isfinite(fpp)) {
                    const double adj = 0.5 * step * fpp / fp;
                    if (std::abs(adj) < 1.0) step /= (1.0 - adj);
                }
            }

            double next = x[j] - step;
            // Negated so a NaN update falls back to bisection as well.
            if (!(next > lo[i] && next < hi[i])) {
                next = 0.5 * (lo[i] + hi[i]);
                step = x[j] - next;
                ++bisections;
            }

            result.root[i] = next;
            result.iterations[i] += 1;
            maxStep = std::max(maxStep, std::abs(step));

            const double tol = options.tolAbs + options.tolRel * std::abs(next);
            if (std::abs(step) <= tol || hi[i] - lo[i] <= tol)
                result.status[k] = HalleyStatus::CONVERGED;
            else
                stillActive.push_back(i);
        }
        active.swap(stillActive);

        if (diag.is_open() && options.diagVerbose)
            diag << label << " iter " << (iter + 1)
                 << ": active=" << active.size() << " bisections=" << bisections
                 << " maxStep=" << maxStep << "\n";
    }

    writeSummary(diag, result, iter, label);
    return result;
}

void requireConvergence(const HalleyResult &result, const std::string &label)
{
    const Eigen::Index failed = result.failedCount();
    if (failed == 0) return;

    Eigen::Index first = 0;
    while (result.status[static_cast<size_t>(first)] == HalleyStatus::CONVERGED)
        ++first;

    std::ostringstream msg;
    msg << label << ": " << failed << " of " << result.root.size()
        << " elements did not converge (first at flat index " << first << ": "
        << toString(result.status[static_cast<size_t>(first)]) << " after "
        << result.iterations[first] << " iterations, x=" << result.root[first]
        << ", f=" << result.residual[first] << ")";
    throw ConvergenceError(msg.str());
}
