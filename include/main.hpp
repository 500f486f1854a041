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
 * @file main.hpp
 * @brief File-level documentation for the SNU_PVSim command-line driver.
 *
 * The driver (src/main.cpp) reads one set of single-diode model parameters
 * and the solver options from long options, validates both, and prints the
 * twelve I-V curve parameters. With `--sweep <points>` it also prints a table
 * of I and P at evenly spaced voltages from 0 to V_oc, computed in a single
 * batched solve.
 *
 * Exit status:
 *  - 0 on success or `--help`
 *  - 1 on a malformed number, invalid parameters or options, or a solver
 *    failure (ConvergenceError / DomainError); the message goes to stderr
 *
 * Usage:
 *   ./SNU_PVSim --ns 60 --t-degc 50 --iph 8.5 --irs 5e-10 --n 1.1 \
 *               --rs 0.3 --gp 0.002 --sweep 11
 *
 * Related headers:
 *  - SolverOptions.hpp for `--tol-abs`, `--tol-rel`, `--max-iters`,
 *    `--diag-file` and `--diag-verbose`
 *  - SingleDiodeEquation.hpp for the computations performed
 */

#pragma once

// No declarations; src/main.cpp includes this header for the documentation
// above.
