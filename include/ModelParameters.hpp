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
 * @file ModelParameters.hpp
 * @brief Typed records consumed and produced by the single-diode solver.
 *
 * `ModelParameters` replaces a string-keyed parameter mapping with a fixed
 * set of fields. Its only constructor takes all seven fields, so a missing
 * parameter is a compile-time error rather than a runtime key lookup failure.
 * Each field is a `FloatArray`; the fields need only be broadcast-compatible,
 * not equal in shape.
 *
 * Usage example:
 * @code
 * ModelParameters params(1.0, 25.0, 6.0, 1e-9, 1.0, 0.05, 0.001);
 * FloatArray I = currentAtVoltage(0.6, params);
 * @endcode
 */

#pragma once

#include <string>

#include "FloatArray.hpp"

/**
 * @struct ModelParameters
 * @brief Five physical parameters plus two structural constants of the SDE.
 */
struct ModelParameters
{
    ModelParameters(FloatArray N_s, FloatArray T_degC, FloatArray I_ph_A,
                    FloatArray I_rs_A, FloatArray n, FloatArray R_s_Ohm,
                    FloatArray G_p_S);

    FloatArray N_s;     /**< Number of cells in series (integer-valued). */
    FloatArray T_degC;  /**< Junction temperature [degC]. */
    FloatArray I_ph_A;  /**< Photogenerated current [A]. */
    FloatArray I_rs_A;  /**< Diode reverse-saturation current [A]. */
    FloatArray n;       /**< Diode ideality factor [.]. */
    FloatArray R_s_Ohm; /**< Series resistance [Ohm]. */
    FloatArray G_p_S;   /**< Shunt (parallel) conductance [S]. */

    /**
     * @brief Common broadcast shape of the seven fields.
     *
     * Throws std::invalid_argument when the fields are not broadcast
     * compatible.
     */
    Shape shape() const;

    /**
     * @brief Check that every element lies in the physical domain.
     *
     * Requires, element-wise and finite: N_s positive and integer-valued,
     * T_degC above absolute zero, I_ph_A >= 0, I_rs_A > 0, n > 0,
     * R_s_Ohm >= 0, G_p_S >= 0.
     *
     * The solver does not call this; non-physical inputs surface there as
     * ConvergenceError or DomainError.
     *
     * Throws std::invalid_argument naming the first offending field.
     */
    void validate() const;
};

/**
 * @struct IVData
 * @brief Terminal current/voltage pair, broadcast-compatible with the model.
 */
struct IVData
{
    FloatArray I_A; /**< Terminal current [A]. */
    FloatArray V_V; /**< Terminal voltage [V]. */
};

/**
 * @struct IVCurveParameters
 * @brief The canonical I-V curve descriptors, in canonical order.
 *
 * Every field has the broadcast shape of the model parameters it was
 * computed from.
 */
struct IVCurveParameters
{
    FloatArray I_sc_A;   /**< Short-circuit current [A]. */
    FloatArray R_sc_Ohm; /**< Resistance at short circuit [Ohm]. */
    FloatArray V_x_V;    /**< V_oc / 2 [V]. */
    FloatArray I_x_A;    /**< Current at V_x_V [A]. */
    FloatArray I_mp_A;   /**< Current at maximum power [A]. */
    FloatArray P_mp_W;   /**< Maximum power [W]. */
    FloatArray V_mp_V;   /**< Voltage at maximum power [V]. */
    FloatArray V_xx_V;   /**< (V_mp + V_oc) / 2 [V]. */
    FloatArray I_xx_A;   /**< Current at V_xx_V [A]. */
    FloatArray R_oc_Ohm; /**< Resistance at open circuit [Ohm]. */
    FloatArray V_oc_V;   /**< Open-circuit voltage [V]. */
    FloatArray FF;       /**< Fill factor [.], NaN where I_sc * V_oc == 0. */
};
