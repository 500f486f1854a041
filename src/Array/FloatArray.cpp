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
 * @file FloatArray.cpp
 * @brief Implementation of FloatArray and the broadcast helpers.
 *
 * `broadcastTo` walks the target index space with an odometer counter and
 * a per-dimension source stride that is zero along broadcast dimensions, so
 * no temporary index arrays are allocated.
 */

#include "FloatArray.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

FloatArray::FloatArray(double value) : m_values(Eigen::ArrayXd::Constant(1, value))
{
}

FloatArray::FloatArray(const std::vector<double> &values)
    : m_shape{static_cast<Eigen::Index>(values.size())},
      m_values(static_cast<Eigen::Index>(values.size()))
{
    for (size_t i = 0; i < values.size(); ++i)
        m_values[static_cast<Eigen::Index>(i)] = values[i];
}

FloatArray::FloatArray(const Shape &shape, const Eigen::ArrayXd &values)
    : m_shape(shape), m_values(values)
{
    for (Eigen::Index extent : m_shape) {
        if (extent < 0)
            throw std::invalid_argument("negative extent in shape " +
                                        shapeToString(m_shape));
    }
    if (shapeSize(m_shape) != m_values.size()) {
        std::ostringstream msg;
        msg << "shape " << shapeToString(m_shape) << " needs "
            << shapeSize(m_shape) << " values, got " << m_values.size();
        throw std::invalid_argument(msg.str());
    }
}

FloatArray FloatArray::full(const Shape &shape, double value)
{
    return FloatArray(shape, Eigen::ArrayXd::Constant(shapeSize(shape), value));
}

double FloatArray::at(const Shape &index) const
{
    if (index.size() != m_shape.size())
        throw std::out_of_range("index rank does not match array rank");

    Eigen::Index flat = 0;
    for (size_t k = 0; k < m_shape.size(); ++k) {
        if (index[k] < 0 || index[k] >= m_shape[k])
            throw std::out_of_range("index out of bounds for shape " +
                                    shapeToString(m_shape));
        flat = flat * m_shape[k] + index[k];
    }
    return m_values[flat];
}

double FloatArray::item() const
{
    if (m_values.size() != 1)
        throw std::invalid_argument(
            "item() requires a single element, array has shape " +
            shapeToString(m_shape));
    return m_values[0];
}

Eigen::Index shapeSize(const Shape &shape)
{
    Eigen::Index size = 1;
    for (Eigen::Index extent : shape) size *= extent;
    return size;
}

std::string shapeToString(const Shape &shape)
{
    std::ostringstream out;
    out << "(";
    for (size_t k = 0; k < shape.size(); ++k) {
        if (k > 0) out << ", ";
        out << shape[k];
    }
    // Match the usual 1-tuple spelling, e.g. "(3,)".
    if (shape.size() == 1) out << ",";
    out << ")";
    return out.str();
}

Shape broadcastShapes(const Shape &a, const Shape &b)
{
    const size_t ndim = std::max(a.size(), b.size());
    Shape result(ndim, 1);

    for (size_t k = 0; k < ndim; ++k) {
        // Align on trailing dimensions; missing leading dims count as 1.
        Eigen::Index ea = 1, eb = 1;
        if (k < a.size()) ea = a[a.size() - 1 - k];
        if (k < b.size()) eb = b[b.size() - 1 - k];

        Eigen::Index extent;
        if (ea == eb || eb == 1) {
            extent = ea;
        } else if (ea == 1) {
            extent = eb;
        } else {
            throw std::invalid_argument("shapes " + shapeToString(a) +
                                        " and " + shapeToString(b) +
                                        " cannot be broadcast together");
        }
        result[ndim - 1 - k] = extent;
    }
    return result;
}

Shape broadcastShapes(const std::vector<Shape> &shapes)
{
    Shape result;
    for (const auto &shape : shapes) result = broadcastShapes(result, shape);
    return result;
}

Eigen::ArrayXd broadcastTo(const FloatArray &array, const Shape &shape)
{
    if (broadcastShapes(array.shape(), shape) != shape)
        throw std::invalid_argument("cannot broadcast shape " +
                                    shapeToString(array.shape()) + " to " +
                                    shapeToString(shape));

    const Eigen::Index total = shapeSize(shape);
    if (array.shape() == shape) return array.values();
    if (array.size() == 1)
        return Eigen::ArrayXd::Constant(total, array.values()[0]);
    if (total == 0) return Eigen::ArrayXd(0);

    // Source strides aligned to the target rank; 0 along broadcast dims.
    const size_t ndim = shape.size();
    const size_t offset = ndim - array.shape().size();
    std::vector<Eigen::Index> strides(ndim, 0);
    Eigen::Index stride = 1;
    for (size_t k = array.shape().size(); k-- > 0;) {
        if (array.shape()[k] != 1) strides[offset + k] = stride;
        stride *= array.shape()[k];
    }

    Eigen::ArrayXd out(total);
    std::vector<Eigen::Index> counter(ndim, 0);
    Eigen::Index src = 0;
    for (Eigen::Index flat = 0; flat < total; ++flat) {
        out[flat] = array.values()[src];

        // Advance the odometer, innermost dimension first.
        for (size_t k = ndim; k-- > 0;) {
            if (++counter[k] < shape[k]) {
                src += strides[k];
                break;
            }
            src -= strides[k] * (shape[k] - 1);
            counter[k] = 0;
        }
    }
    return out;
}
