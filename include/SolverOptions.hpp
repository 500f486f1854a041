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

#pragma once

#include <cmath>
#include <stdexcept>
#include <string>

/*
 * SolverOptions.hpp
 *
 * Lightweight configuration container for the single-diode root finder.
 *
 * `SolverOptions` holds the tolerances, iteration limit and diagnostics
 * settings of the Halley iteration behind every single-diode solve. It is
 * filled in by the command-line driver or by tests. The same options object
 * is passed unchanged through nested solves (for example the current solves
 * performed inside the maximum-power search).
 *
 * Defaults:
 *  - tolAbs      = 1.48e-8  absolute step tolerance
 *  - tolRel      = 0.0      relative step tolerance
 *  - maxIters    = 50       iteration limit per element
 *  - diagFile    = ""       diagnostics log disabled
 *  - diagVerbose = false    no per-iteration trace
 */
/**
 * @struct SolverOptions
 * @brief Runtime options controlling solver tolerances and diagnostics.
 *
 * Plain public fields, set at the call site. Every public solve calls
 * `validate()` before iterating, so a bad tolerance is reported before any
 * work is done.
 */
struct SolverOptions
{
    /**
     * @brief Absolute tolerance on the size of the last update.
     *
     * An element is converged once its last Halley update dx satisfies
     * |dx| <= tolAbs + tolRel * |x|.
     */
    double tolAbs = 1.48e-8;

    /** @brief Relative tolerance on the size of the last update. */
    double tolRel = 0.0;

    /**
     * @brief Maximum number of iterations per element.
     *
     * Elements still unconverged after `maxIters` updates are reported as
     * failures; the whole call then throws `ConvergenceError`.
     */
    int maxIters = 50;

    /**
     * @brief Path to the diagnostic log file appended to by the solver.
     *
     * An empty string disables the log entirely.
     */
    std::string diagFile;

    /**
     * @brief Emit a per-iteration trace into `diagFile`.
     *
     * When false only a one-line summary per solve (and failure details) is
     * written.
     */
    bool diagVerbose = false;

    /**
     * @brief Validate option values.
     *
     * Throws:
     *   - std::invalid_argument if any required relationship is violated
     *     (non-positive iteration limit, negative or non-finite tolerances,
     *     or both tolerances zero).
     */
    void validate() const
    {
        if (maxIters <= 0)
            throw std::invalid_argument("maxIters must be > 0");
        if (!std::isfinite(tolAbs) || tolAbs < 0.0)
            throw std::invalid_argument("tolAbs must be finite and >= 0");
        if (!std::isfinite(tolRel) || tolRel < 0.0)
            throw std::invalid_argument("tolRel must be finite and >= 0");
        if (tolAbs == 0.0 && tolRel == 0.0)
            throw std::invalid_argument("tolAbs and tolRel cannot both be 0");
    }
};
