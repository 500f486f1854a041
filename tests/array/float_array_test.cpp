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
#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "FloatArray.hpp"

/*
 * float_array_test.cpp
 *
 * Unit tests for FloatArray and the broadcasting helpers.
 *
 * Broadcasting follows the usual trailing-dimension rule: extents are
 * compared right to left and must be equal or 1.
 */

TEST(FloatArray, ScalarIsZeroDimensional)
{
  FloatArray a(2.5);
  EXPECT_TRUE(a.isScalar());
  EXPECT_EQ(a.ndim(), 0);
  EXPECT_EQ(a.size(), 1);
  EXPECT_DOUBLE_EQ(a.item(), 2.5);
  EXPECT_DOUBLE_EQ(a.at(Shape()), 2.5);
}

TEST(FloatArray, VectorIsOneDimensional)
{
  FloatArray a({1.0, 2.0, 3.0});
  EXPECT_FALSE(a.isScalar());
  EXPECT_EQ(a.shape(), Shape{3});
  EXPECT_DOUBLE_EQ(a[2], 3.0);
  EXPECT_THROW(a.item(), std::invalid_argument);
}

TEST(FloatArray, ShapedConstructorChecksSize)
{
  Eigen::ArrayXd six(6);
  six << 0, 1, 2, 3, 4, 5;
  FloatArray a(Shape{2, 3}, six);
  EXPECT_DOUBLE_EQ(a.at({1, 0}), 3.0);
  EXPECT_DOUBLE_EQ(a.at({0, 2}), 2.0);

  EXPECT_THROW(FloatArray(Shape{4}, six), std::invalid_argument);
  EXPECT_THROW(FloatArray(Shape{-1}, Eigen::ArrayXd(0)), std::invalid_argument);
}

TEST(FloatArray, AtRejectsBadIndex)
{
  FloatArray a = FloatArray::full({2, 2}, 1.0);
  EXPECT_THROW(a.at({2, 0}), std::out_of_range);
  EXPECT_THROW(a.at({0}), std::out_of_range);
}

TEST(FloatArray, EmptyArrayIsAllowed)
{
  FloatArray a(std::vector<double>{});
  EXPECT_EQ(a.shape(), Shape{0});
  EXPECT_EQ(a.size(), 0);
}

TEST(ShapeToString, Spelling)
{
  EXPECT_EQ(shapeToString(Shape()), "()");
  EXPECT_EQ(shapeToString(Shape{3}), "(3,)");
  EXPECT_EQ(shapeToString(Shape{2, 3}), "(2, 3)");
}

TEST(BroadcastShapes, CompatibleShapes)
{
  EXPECT_EQ(broadcastShapes(Shape(), Shape{3}), (Shape{3}));
  EXPECT_EQ(broadcastShapes(Shape{3}, Shape{1}), (Shape{3}));
  EXPECT_EQ(broadcastShapes(Shape{2, 1}, Shape{3}), (Shape{2, 3}));
  EXPECT_EQ(broadcastShapes(Shape{4, 1, 5}, Shape{3, 1}), (Shape{4, 3, 5}));
  EXPECT_EQ(broadcastShapes(Shape{0}, Shape()), (Shape{0}));
}

TEST(BroadcastShapes, IncompatibleShapesThrow)
{
  EXPECT_THROW(broadcastShapes(Shape{2}, Shape{3}), std::invalid_argument);
  EXPECT_THROW(broadcastShapes(Shape{2, 3}, Shape{2}), std::invalid_argument);
  EXPECT_THROW(broadcastShapes({Shape(), Shape{3}, Shape{4}}),
               std::invalid_argument);
}

TEST(BroadcastShapes, ManyShapes)
{
  EXPECT_EQ(broadcastShapes({Shape(), Shape{3}, Shape{2, 1}}), (Shape{2, 3}));
  EXPECT_EQ(broadcastShapes(std::vector<Shape>{}), Shape());
}

TEST(BroadcastTo, ScalarFillsTarget)
{
  Eigen::ArrayXd out = broadcastTo(FloatArray(7.0), Shape{2, 2});
  ASSERT_EQ(out.size(), 4);
  EXPECT_TRUE((out == 7.0).all());
}

TEST(BroadcastTo, RowAndColumnExpand)
{
  // Row (3,) against (2, 3): repeated per row.
  Eigen::ArrayXd row = broadcastTo(FloatArray({1.0, 2.0, 3.0}), Shape{2, 3});
  Eigen::ArrayXd expectedRow(6);
  expectedRow << 1, 2, 3, 1, 2, 3;
  EXPECT_TRUE((row == expectedRow).all());

  // Column (2, 1) against (2, 3): repeated along each row.
  Eigen::ArrayXd colValues(2);
  colValues << 10, 20;
  Eigen::ArrayXd col = broadcastTo(FloatArray(Shape{2, 1}, colValues), Shape{2, 3});
  Eigen::ArrayXd expectedCol(6);
  expectedCol << 10, 10, 10, 20, 20, 20;
  EXPECT_TRUE((col == expectedCol).all());
}

TEST(BroadcastTo, MiddleDimension)
{
  Eigen::ArrayXd values(4);
  values << 1, 2, 3, 4;
  // (2, 1, 2) -> (2, 2, 2)
  Eigen::ArrayXd out = broadcastTo(FloatArray(Shape{2, 1, 2}, values), Shape{2, 2, 2});
  Eigen::ArrayXd expected(8);
  expected << 1, 2, 1, 2, 3, 4, 3, 4;
  EXPECT_TRUE((out == expected).all());
}

TEST(BroadcastTo, CannotShrink)
{
  EXPECT_THROW(broadcastTo(FloatArray({1.0, 2.0, 3.0}), Shape()),
               std::invalid_argument);
  EXPECT_THROW(broadcastTo(FloatArray({1.0, 2.0}), Shape{3}),
               std::invalid_argument);
}

// End of file - no main(): gtest_main supplies the test runner.
