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

#include <limits>
#include <stdexcept>

#include "SolverOptions.hpp"

/*
 * solver_options_test.cpp
 *
 * Unit tests for SolverOptions defaults and SolverOptions::validate.
 */

TEST(SolverOptions, Defaults)
{
  SolverOptions opts;
  EXPECT_DOUBLE_EQ(opts.tolAbs, 1.48e-8);
  EXPECT_DOUBLE_EQ(opts.tolRel, 0.0);
  EXPECT_EQ(opts.maxIters, 50);
  EXPECT_TRUE(opts.diagFile.empty());
  EXPECT_FALSE(opts.diagVerbose);
  EXPECT_NO_THROW(opts.validate());
}

TEST(SolverOptions, RejectsNonPositiveIterationLimit)
{
  SolverOptions opts;
  opts.maxIters = 0;
  EXPECT_THROW(opts.validate(), std::invalid_argument);
  opts.maxIters = -3;
  EXPECT_THROW(opts.validate(), std::invalid_argument);
}

TEST(SolverOptions, RejectsBadTolerances)
{
  SolverOptions opts;
  opts.tolAbs = -1e-9;
  EXPECT_THROW(opts.validate(), std::invalid_argument);

  opts = SolverOptions();
  opts.tolRel = std::numeric_limits<double>::infinity();
  EXPECT_THROW(opts.validate(), std::invalid_argument);

  opts = SolverOptions();
  opts.tolAbs = 0.0;
  EXPECT_THROW(opts.validate(), std::invalid_argument);
}

TEST(SolverOptions, RelativeToleranceAlone)
{
  SolverOptions opts;
  opts.tolAbs = 0.0;
  opts.tolRel = 1e-12;
  EXPECT_NO_THROW(opts.validate());
}

// End of file - no main(): gtest_main supplies the test runner.
