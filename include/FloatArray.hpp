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
 * @file FloatArray.hpp
 * @brief Broadcastable N-dimensional array of doubles.
 *
 * Every input and output of the single-diode solver is a `FloatArray`: a
 * 0-d scalar, a 1-d vector, or an N-d array stored row-major. Values live in
 * an `Eigen::ArrayXd` so that element-wise arithmetic over a whole batch can
 * be written with Eigen array expressions.
 *
 * Broadcasting follows one rule, implemented once in `broadcastShapes`:
 *  - shapes are aligned on their trailing dimensions,
 *  - a missing leading dimension counts as 1,
 *  - each aligned pair must be equal or one of them must be 1 (the result
 *    takes the other extent).
 * A scalar therefore broadcasts against anything.
 *
 * Usage example:
 * @code
 * FloatArray v(std::vector<double>{0.0, 0.3, 0.6});   // shape {3}
 * FloatArray t = 25.0;                                // shape {}
 * Shape s = broadcastShapes(v.shape(), t.shape());    // {3}
 * Eigen::ArrayXd tFull = broadcastTo(t, s);           // {25, 25, 25}
 * @endcode
 */

#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

/** @brief Array extents, outermost first. Empty for a 0-d scalar. */
using Shape = std::vector<Eigen::Index>;

/**
 * @class FloatArray
 * @brief Shape plus contiguous row-major values.
 *
 * Implicit construction from `double` keeps call sites short
 * (`currentAtVoltage(0.6, params)`). The value storage is always consistent
 * with the shape; constructors throw `std::invalid_argument` otherwise.
 */
class FloatArray
{
   public:
    /** @brief 0-d scalar. */
    FloatArray(double value = 0.0);

    /** @brief 1-d array holding `values`. */
    explicit FloatArray(const std::vector<double> &values);

    /**
     * @brief N-d array with explicit shape.
     *
     * @param shape Extents (each >= 0).
     * @param values Row-major values; size must equal the product of extents.
     */
    FloatArray(const Shape &shape, const Eigen::ArrayXd &values);

    /** @brief Array of the given shape filled with `value`. */
    static FloatArray full(const Shape &shape, double value);

    const Shape &shape() const { return m_shape; }
    int ndim() const { return static_cast<int>(m_shape.size()); }
    Eigen::Index size() const { return m_values.size(); }
    bool isScalar() const { return m_shape.empty(); }

    const Eigen::ArrayXd &values() const { return m_values; }

    /** @brief Flat (row-major) element access, unchecked. */
    double operator[](Eigen::Index i) const { return m_values[i]; }

    /**
     * @brief Multi-index element access.
     *
     * Throws std::out_of_range on a rank mismatch or out-of-bounds index.
     */
    double at(const Shape &index) const;

    /**
     * @brief The single value of a size-1 array.
     *
     * Throws std::invalid_argument if the array does not hold exactly one
     * element.
     */
    double item() const;

   private:
    Shape m_shape;
    Eigen::ArrayXd m_values;
};

/** @brief Product of extents (1 for a scalar). */
Eigen::Index shapeSize(const Shape &shape);

/** @brief Render a shape as "(2, 3)"; "()" for a scalar. */
std::string shapeToString(const Shape &shape);

/**
 * @brief Common shape of two shapes under the broadcast rule.
 *
 * Throws std::invalid_argument when the shapes are incompatible.
 */
Shape broadcastShapes(const Shape &a, const Shape &b);

/** @brief Common shape of any number of shapes (scalar for an empty list). */
Shape broadcastShapes(const std::vector<Shape> &shapes);

/**
 * @brief Materialise `array` at `shape`.
 *
 * `array.shape()` must broadcast to `shape` without changing it; otherwise
 * std::invalid_argument is thrown.
 *
 * @return Row-major values of size shapeSize(shape).
 */
Eigen::ArrayXd broadcastTo(const FloatArray &array, const Shape &shape);
