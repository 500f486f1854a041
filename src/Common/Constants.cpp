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
 * @file Constants.cpp
 * @brief Materials table, temperature conversion and thermal voltage.
 */

#include "Constants.hpp"

#include <stdexcept>
#include <string>

FloatArray convertCelsiusToKelvin(const FloatArray &T_degC)
{
    return FloatArray(T_degC.shape(), T_degC.values() + ZERO_DEGC_IN_K);
}

FloatArray convertKelvinToCelsius(const FloatArray &T_K)
{
    return FloatArray(T_K.shape(), T_K.values() - ZERO_DEGC_IN_K);
}

std::string materialName(Material material)
{
    switch (material) {
        case Material::CIGS:
            return "CIGS";
        case Material::CIS:
            return "CIS";
        case Material::CdTe:
            return "CdTe";
        case Material::GaAs:
            return "GaAs";
        case Material::monoSi:
            return "mono-Si";
        case Material::multiSi:
            return "multi-Si";
        case Material::polySi:
            return "poly-Si";
        case Material::xSi:
            return "x-Si";
    }
    throw std::invalid_argument("unknown material");
}

Material materialFromName(const std::string &name)
{
    const Material all[] = {Material::CIGS,   Material::CIS,
                            Material::CdTe,   Material::GaAs,
                            Material::monoSi, Material::multiSi,
                            Material::polySi, Material::xSi};
    for (Material material : all) {
        if (materialName(material) == name) return material;
    }
    throw std::invalid_argument("unknown material name: " + name);
}

MaterialsInfo materialsInfo(Material material)
{
    switch (material) {
        case Material::CIGS:
            return MaterialsInfo{1.15};
        case Material::CIS:
            return MaterialsInfo{1.010};
        case Material::CdTe:
            return MaterialsInfo{1.475};
        case Material::GaAs:
            // At 300 K, Kittel, Intro. to Solid State Physics, 6th ed., p 185.
            return MaterialsInfo{1.43};
        case Material::monoSi:
        case Material::multiSi:
        case Material::polySi:
        case Material::xSi:
            return MaterialsInfo{1.121};
    }
    throw std::invalid_argument("unknown material");
}

FloatArray scaledThermalVoltage(const FloatArray &N_s, const FloatArray &T_degC)
{
    const Shape shape = broadcastShapes(N_s.shape(), T_degC.shape());
    return FloatArray(shape, scaledThermalVoltage(broadcastTo(N_s, shape),
                                                  broadcastTo(T_degC, shape)));
}

Eigen::ArrayXd scaledThermalVoltage(const Eigen::ArrayXd &N_s,
                                    const Eigen::ArrayXd &T_degC)
{
    return N_s * (K_B_J_PER_K * (T_degC + ZERO_DEGC_IN_K) / Q_C);
}
