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
 * @file ModelParameters.cpp
 * @brief Shape and domain checks for ModelParameters.
 */

#include "ModelParameters.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "Constants.hpp"

ModelParameters::ModelParameters(FloatArray N_s, FloatArray T_degC,
                                 FloatArray I_ph_A, FloatArray I_rs_A,
                                 FloatArray n, FloatArray R_s_Ohm,
                                 FloatArray G_p_S)
    : N_s(std::move(N_s)),
      T_degC(std::move(T_degC)),
      I_ph_A(std::move(I_ph_A)),
      I_rs_A(std::move(I_rs_A)),
      n(std::move(n)),
      R_s_Ohm(std::move(R_s_Ohm)),
      G_p_S(std::move(G_p_S))
{
}

Shape ModelParameters::shape() const
{
    return broadcastShapes({N_s.shape(), T_degC.shape(), I_ph_A.shape(),
                            I_rs_A.shape(), n.shape(), R_s_Ohm.shape(),
                            G_p_S.shape()});
}

namespace
{
// Throws if any element of `field` fails `ok`.
template <typename Predicate>
void requireAll(const FloatArray &field, const char *name,
                const char *requirement, Predicate ok)
{
    for (Eigen::Index i = 0; i < field.size(); ++i) {
        const double value = field[i];
        if (!std::isfinite(value) || !ok(value)) {
            std::ostringstream msg;
            msg << name << " must be finite and " << requirement
                << ", got " << value << " at flat index " << i;
            throw std::invalid_argument(msg.str());
        }
    }
}
}  // namespace

void ModelParameters::validate() const
{
    // Also rejects incompatible shapes.
    shape();

    requireAll(N_s, "N_s", "a positive integer",
               [](double v) { return v >= 1.0 && std::floor(v) == v; });
    requireAll(T_degC, "T_degC", "above absolute zero",
               [](double v) { return v > -ZERO_DEGC_IN_K; });
    requireAll(I_ph_A, "I_ph_A", ">= 0", [](double v) { return v >= 0.0; });
    requireAll(I_rs_A, "I_rs_A", "> 0", [](double v) { return v > 0.0; });
    requireAll(n, "n", "> 0", [](double v) { return v > 0.0; });
    requireAll(R_s_Ohm, "R_s_Ohm", ">= 0", [](double v) { return v >= 0.0; });
    requireAll(G_p_S, "G_p_S", ">= 0", [](double v) { return v >= 0.0; });
}
