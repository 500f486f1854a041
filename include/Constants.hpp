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
 * @file Constants.hpp
 * @brief Physical constants and shared items for DC device modeling.
 *
 * Holds the CODATA exact values used by the solver, temperature conversion,
 * Standard Test Condition (STC) reference values, the photovoltaic materials
 * table and the scaled thermal voltage helper used by every single-diode
 * computation.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

#include "FloatArray.hpp"

/** @brief Elementary charge [C] (exact). */
constexpr double Q_C = 1.602176634e-19;

/** @brief Boltzmann constant [J/K] (exact). */
constexpr double K_B_J_PER_K = 1.380649e-23;

/** @brief Boltzmann constant [eV/K]. */
constexpr double K_B_EV_PER_K = 8.617333262e-05;

/** @brief Speed of light in vacuum [m/s] (exact). */
constexpr double C_M_PER_S = 299792458.0;

/** @brief Planck constant [J s] (exact). */
constexpr double H_J_S = 6.62607015e-34;

/** @brief Offset between the Celsius and Kelvin scales. */
constexpr double ZERO_DEGC_IN_K = 273.15;

/** @brief STC temperature [degC]. */
constexpr double T_DEGC_STC = 25.0;

/** @brief STC temperature [K]. */
constexpr double T_K_STC = T_DEGC_STC + ZERO_DEGC_IN_K;

/**
 * @brief Hemispherical irradiance at STC [W/m^2].
 *
 * Includes the specified sun orientation, plane orientation and spectrum.
 */
constexpr double G_HEMI_W_PER_M2_STC = 1000.0;

/** @brief Lower limit on the ideality factor of the first diode. */
constexpr double N_IC_MIN = 1.0;

/** @brief Upper limit on the ideality factor of the first diode. */
constexpr double N_IC_MAX = 2.0;

inline double convertCelsiusToKelvin(double T_degC)
{
    return T_degC + ZERO_DEGC_IN_K;
}

inline double convertKelvinToCelsius(double T_K) { return T_K - ZERO_DEGC_IN_K; }

/** @brief Element-wise Celsius to Kelvin, shape preserved. */
FloatArray convertCelsiusToKelvin(const FloatArray &T_degC);

/** @brief Element-wise Kelvin to Celsius, shape preserved. */
FloatArray convertKelvinToCelsius(const FloatArray &T_K);

/**
 * @enum Material
 * @brief Photovoltaic materials with known STC band gaps.
 */
enum class Material
{
    CIGS,    /**< Copper Indium Gallium Selenide. */
    CIS,     /**< Copper Indium diSelenide. */
    CdTe,    /**< Cadmium Telluride. */
    GaAs,    /**< Gallium Arsenide. */
    monoSi,  /**< Mono-crystalline Silicon. */
    multiSi, /**< Multi-crystalline Silicon. */
    polySi,  /**< Poly-crystalline Silicon. */
    xSi      /**< Crystalline Silicon. */
};

/**
 * @struct MaterialsInfo
 * @brief Per-material data.
 */
struct MaterialsInfo
{
    double E_g_eV_stc; /**< Band gap at STC [eV]. */
};

/** @brief Conventional name of a material, e.g. "mono-Si". */
std::string materialName(Material material);

/**
 * @brief Parse a conventional material name.
 *
 * Throws std::invalid_argument for an unrecognised name.
 */
Material materialFromName(const std::string &name);

/**
 * @brief Look up material data.
 *
 * Band gaps are from De Soto et al. 2006, except GaAs (Kittel, 300 K).
 */
MaterialsInfo materialsInfo(Material material);

/**
 * @brief Thermal voltage scaled by the number of cells in series [V].
 *
 * Computes N_s * k_B * T_K / q element-wise over the broadcast of the two
 * inputs.
 *
 * @param N_s Number of cells in series in each parallel string.
 * @param T_degC Junction temperature [degC].
 * @return Scaled thermal voltage, shape broadcastShapes(N_s, T_degC).
 */
FloatArray scaledThermalVoltage(const FloatArray &N_s, const FloatArray &T_degC);

/** @brief Flat-array form used by the solver (inputs already broadcast). */
Eigen::ArrayXd scaledThermalVoltage(const Eigen::ArrayXd &N_s,
                                    const Eigen::ArrayXd &T_degC);
