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
 * @file SolverErrors.hpp
 * @brief Exception types raised by the single-diode solver.
 *
 * Two failure kinds are distinguished:
 *  - `ConvergenceError`: the Halley iteration did not converge for at least
 *    one element of a batch. No partial result is ever returned.
 *  - `DomainError`: an analytic initial guess received inputs outside its
 *    domain (e.g. a non-positive logarithm argument). Raised before any
 *    iteration starts.
 *
 * A zero denominator in the fill factor is not an error; see
 * `fillFactor()` in SingleDiodeEquation.hpp.
 */

#pragma once

#include <stdexcept>
#include <string>

/**
 * @class ConvergenceError
 * @brief Raised when any element of a batched solve fails to converge.
 */
class ConvergenceError : public std::runtime_error
{
   public:
    explicit ConvergenceError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @class DomainError
 * @brief Raised when an initial-condition formula is evaluated out of domain.
 */
class DomainError : public std::domain_error
{
   public:
    explicit DomainError(const std::string &what) : std::domain_error(what) {}
};
