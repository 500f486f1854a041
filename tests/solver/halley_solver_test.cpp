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

#include <cmath>
#include <cstdio>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "HalleySolver.hpp"
#include "SolverErrors.hpp"
#include "SolverOptions.hpp"

/*
 * halley_solver_test.cpp
 *
 * Unit tests for solveHalley, solveHalleyBracketed and requireConvergence.
 *
 * Behavior:
 *   - Each element iterates until its update is within tolerance, its
 *     residual is exactly zero, or it fails; finished elements are frozen.
 *   - Failures are reported per element through HalleyResult::status and
 *     turned into ConvergenceError by requireConvergence.
 *   - The bracketed variant keeps every iterate inside its sign-change
 *     bracket and bisects whenever the Halley update would leave it.
 */

namespace
{
// f(x) = x^2 - c, one value of c per element.
HalleyFunction squareMinus(const Eigen::ArrayXd &c)
{
  return [c](const Eigen::ArrayXd &x) {
    HalleyEvaluation ev;
    ev.f = x.square() - c;
    ev.fprime = 2.0 * x;
    ev.fprime2 = Eigen::ArrayXd::Constant(x.size(), 2.0);
    return ev;
  };
}

// Adapts a whole-batch function to the subset callback signature. Only valid
// for single-element batches, where the active subset is the whole batch.
HalleySubsetFunction onSubset(const HalleyFunction &fn)
{
  return [fn](const Eigen::ArrayXd &x, const std::vector<Eigen::Index> &) {
    return fn(x);
  };
}

// f(x) = atan(x): plain Newton and Halley steps run away from |x| > ~1.4.
HalleyEvaluation arcTangent(const Eigen::ArrayXd &x)
{
  HalleyEvaluation ev;
  ev.f = x.atan();
  ev.fprime = 1.0 / (1.0 + x.square());
  ev.fprime2 = -2.0 * x / (1.0 + x.square()).square();
  return ev;
}

Eigen::ArrayXd values(std::initializer_list<double> list)
{
  Eigen::ArrayXd out(static_cast<Eigen::Index>(list.size()));
  Eigen::Index i = 0;
  for (double v : list) out[i++] = v;
  return out;
}
}  // namespace

TEST(HalleySolver, SquareRootOfTwo)
{
  HalleyResult r =
      solveHalley(squareMinus(values({2.0})), values({1.0}), SolverOptions(), "x");

  ASSERT_TRUE(r.allConverged());
  EXPECT_NEAR(r.root[0], std::sqrt(2.0), 1e-14);
  EXPECT_GT(r.iterations[0], 0);
  EXPECT_LT(r.iterations[0], 10);
  EXPECT_NO_THROW(requireConvergence(r, "x"));
}

TEST(HalleySolver, BatchSolvesIndependently)
{
  HalleyResult r = solveHalley(squareMinus(values({4.0, 9.0, 1e6})),
                               values({1.0, 1.0, 1.0}), SolverOptions(), "x");

  ASSERT_TRUE(r.allConverged());
  EXPECT_NEAR(r.root[0], 2.0, 1e-12);
  EXPECT_NEAR(r.root[1], 3.0, 1e-12);
  EXPECT_NEAR(r.root[2], 1000.0, 1e-9);
  // The far root needs more updates than the near one.
  EXPECT_GT(r.iterations[2], r.iterations[0]);
}

TEST(HalleySolver, ExactRootNeedsNoUpdate)
{
  HalleyResult r =
      solveHalley(squareMinus(values({9.0})), values({3.0}), SolverOptions(), "x");

  EXPECT_EQ(r.status[0], HalleyStatus::CONVERGED);
  EXPECT_EQ(r.iterations[0], 0);
  EXPECT_DOUBLE_EQ(r.root[0], 3.0);
  EXPECT_DOUBLE_EQ(r.residual[0], 0.0);
}

TEST(HalleySolver, LinearFunctionOneStep)
{
  HalleyFunction linear = [](const Eigen::ArrayXd &x) {
    HalleyEvaluation ev;
    ev.f = x - 3.0;
    ev.fprime = Eigen::ArrayXd::Ones(x.size());
    ev.fprime2 = Eigen::ArrayXd::Zero(x.size());
    return ev;
  };

  HalleyResult r = solveHalley(linear, values({0.0}), SolverOptions(), "x");
  EXPECT_EQ(r.status[0], HalleyStatus::CONVERGED);
  EXPECT_EQ(r.iterations[0], 1);
  EXPECT_DOUBLE_EQ(r.root[0], 3.0);
}

TEST(HalleySolver, ZeroDerivative)
{
  // f(x) = x^2 + 1 has f'(0) == 0.
  HalleyResult r =
      solveHalley(squareMinus(values({-1.0})), values({0.0}), SolverOptions(), "x");

  EXPECT_EQ(r.status[0], HalleyStatus::ZERO_DERIVATIVE);
  EXPECT_FALSE(r.allConverged());
  EXPECT_EQ(r.failedCount(), 1);
}

TEST(HalleySolver, IterationLimit)
{
  // x^2 + 1 has no real root; from x = 1 the iterate bounces between +1 and
  // -1 forever.
  SolverOptions opts;
  opts.maxIters = 5;
  HalleyResult r =
      solveHalley(squareMinus(values({-1.0})), values({1.0}), opts, "x");

  EXPECT_EQ(r.status[0], HalleyStatus::MAX_ITERS);
  EXPECT_EQ(r.iterations[0], 5);
  EXPECT_TRUE(std::isfinite(r.root[0]));
}

TEST(HalleySolver, NonFiniteResidual)
{
  HalleyFunction bad = [](const Eigen::ArrayXd &x) {
    HalleyEvaluation ev;
    ev.f = Eigen::ArrayXd::Constant(x.size(),
                                    std::numeric_limits<double>::quiet_NaN());
    ev.fprime = Eigen::ArrayXd::Ones(x.size());
    ev.fprime2 = Eigen::ArrayXd::Zero(x.size());
    return ev;
  };

  HalleyResult r = solveHalley(bad, values({0.5}), SolverOptions(), "x");
  EXPECT_EQ(r.status[0], HalleyStatus::NON_FINITE);
  EXPECT_EQ(r.iterations[0], 0);
  EXPECT_DOUBLE_EQ(r.root[0], 0.5);
}

TEST(HalleySolver, FailedElementDoesNotDisturbOthers)
{
  SolverOptions opts;
  opts.maxIters = 20;
  HalleyResult r = solveHalley(squareMinus(values({2.0, -1.0})),
                               values({1.0, 1.0}), opts, "x");

  EXPECT_EQ(r.status[0], HalleyStatus::CONVERGED);
  EXPECT_NEAR(r.root[0], std::sqrt(2.0), 1e-14);
  EXPECT_EQ(r.status[1], HalleyStatus::MAX_ITERS);
  EXPECT_EQ(r.failedCount(), 1);
}

TEST(HalleySolver, CallbackSizeMismatchThrows)
{
  HalleyFunction wrongSize = [](const Eigen::ArrayXd &) {
    HalleyEvaluation ev;
    ev.f = Eigen::ArrayXd::Ones(1);
    ev.fprime = Eigen::ArrayXd::Ones(1);
    ev.fprime2 = Eigen::ArrayXd::Ones(1);
    return ev;
  };

  EXPECT_THROW(
      solveHalley(wrongSize, values({1.0, 2.0}), SolverOptions(), "x"),
      std::invalid_argument);
}

TEST(RequireConvergence, ThrowsWithDetails)
{
  SolverOptions opts;
  opts.maxIters = 20;
  HalleyResult r = solveHalley(squareMinus(values({2.0, -1.0})),
                               values({1.0, 1.0}), opts, "V_V");

  try {
    requireConvergence(r, "V_V");
    FAIL() << "expected ConvergenceError";
  } catch (const ConvergenceError &e) {
    std::string what = e.what();
    EXPECT_NE(what.find("V_V"), std::string::npos);
    EXPECT_NE(what.find("1 of 2 elements"), std::string::npos);
    EXPECT_NE(what.find("flat index 1"), std::string::npos);
    EXPECT_NE(what.find("iteration limit reached"), std::string::npos);
  }
}

TEST(HalleySolver, ConvergenceErrorIsRuntimeError)
{
  HalleyResult r =
      solveHalley(squareMinus(values({-1.0})), values({0.0}), SolverOptions(), "x");
  EXPECT_THROW(requireConvergence(r, "x"), std::runtime_error);
}

TEST(HalleySolver, DiagnosticsFile)
{
  const std::string path = testing::TempDir() + "halley_solver_diag.log";
  std::remove(path.c_str());

  SolverOptions opts;
  opts.diagFile = path;
  opts.diagVerbose = true;
  opts.maxIters = 6;
  solveHalley(squareMinus(values({2.0, -1.0})), values({1.0, 1.0}), opts, "I_A");

  std::ifstream in(path);
  ASSERT_TRUE(in.good());
  std::stringstream buffer;
  buffer << in.rdbuf();
  const std::string log = buffer.str();

  EXPECT_NE(log.find("I_A iter 1"), std::string::npos);
  EXPECT_NE(log.find("I_A: size=2"), std::string::npos);
  EXPECT_NE(log.find("failed=1"), std::string::npos);
  EXPECT_NE(log.find("[1] iteration limit reached"), std::string::npos);

  std::remove(path.c_str());
}

TEST(HalleyBracketed, SquareRootOfTwo)
{
  HalleyResult r =
      solveHalleyBracketed(onSubset(squareMinus(values({2.0}))), values({1.0}),
                           values({0.0}), values({2.0}), SolverOptions(), "x");

  ASSERT_TRUE(r.allConverged());
  EXPECT_NEAR(r.root[0], std::sqrt(2.0), 1e-14);
  EXPECT_LT(r.iterations[0], 10);
}

TEST(HalleyBracketed, StaysInsideBracketWherePlainHalleyDiverges)
{
  SolverOptions opts;
  opts.maxIters = 20;
  HalleyResult plain =
      solveHalley(arcTangent, values({3.0}), opts, "x");
  EXPECT_FALSE(plain.allConverged());

  HalleyResult r = solveHalleyBracketed(onSubset(arcTangent), values({3.0}),
                                        values({-5.0}), values({10.0}), opts, "x");
  ASSERT_TRUE(r.allConverged());
  EXPECT_NEAR(r.root[0], 0.0, 1e-12);
}

TEST(HalleyBracketed, BisectsOnZeroDerivative)
{
  // f(x) = x^3 - 8 has f'(0) == 0; the plain solver gives up there.
  HalleyFunction cubeMinusEight = [](const Eigen::ArrayXd &x) {
    HalleyEvaluation ev;
    ev.f = x.cube() - 8.0;
    ev.fprime = 3.0 * x.square();
    ev.fprime2 = 6.0 * x;
    return ev;
  };

  HalleyResult plain =
      solveHalley(cubeMinusEight, values({0.0}), SolverOptions(), "x");
  EXPECT_EQ(plain.status[0], HalleyStatus::ZERO_DERIVATIVE);

  HalleyResult r =
      solveHalleyBracketed(onSubset(cubeMinusEight), values({0.0}), values({-1.0}),
                           values({3.0}), SolverOptions(), "x");
  ASSERT_TRUE(r.allConverged());
  EXPECT_NEAR(r.root[0], 2.0, 1e-12);
}

TEST(HalleyBracketed, SameSignAtBothEnds)
{
  // x^2 + 1 > 0 everywhere.
  HalleyResult r =
      solveHalleyBracketed(onSubset(squareMinus(values({-1.0}))), values({0.0}),
                           values({-1.0}), values({1.0}), SolverOptions(), "x");

  EXPECT_EQ(r.status[0], HalleyStatus::NOT_BRACKETED);
  EXPECT_EQ(r.iterations[0], 0);
  EXPECT_STREQ(toString(HalleyStatus::NOT_BRACKETED), "root not bracketed");
  EXPECT_THROW(requireConvergence(r, "x"), ConvergenceError);
}

TEST(HalleyBracketed, RootAtBracketEnd)
{
  HalleyResult r =
      solveHalleyBracketed(onSubset(squareMinus(values({4.0}))), values({1.0}),
                           values({0.0}), values({2.0}), SolverOptions(), "x");

  EXPECT_EQ(r.status[0], HalleyStatus::CONVERGED);
  EXPECT_EQ(r.iterations[0], 0);
  EXPECT_DOUBLE_EQ(r.root[0], 2.0);
  EXPECT_DOUBLE_EQ(r.residual[0], 0.0);
}

TEST(HalleyBracketed, EndsInEitherOrder)
{
  HalleyResult r =
      solveHalleyBracketed(onSubset(squareMinus(values({2.0}))), values({1.0}),
                           values({2.0}), values({0.0}), SolverOptions(), "x");

  ASSERT_TRUE(r.allConverged());
  EXPECT_NEAR(r.root[0], std::sqrt(2.0), 1e-14);
}

TEST(HalleyBracketed, StartOutsideBracketUsesMidpoint)
{
  // Without the reset, x = -5 would converge to the negative root.
  HalleyResult r =
      solveHalleyBracketed(onSubset(squareMinus(values({2.0}))), values({-5.0}),
                           values({0.0}), values({2.0}), SolverOptions(), "x");

  ASSERT_TRUE(r.allConverged());
  EXPECT_NEAR(r.root[0], std::sqrt(2.0), 1e-14);
}

TEST(HalleyBracketed, EvaluatesOnlyActiveElements)
{
  // f(x) = x - c. Element 0 has its root at the lower end, element 1 starts
  // on its root and element 2 needs one update before landing on it.
  const Eigen::ArrayXd c = values({0.0, 1.0, 2.0});
  std::vector<std::vector<Eigen::Index>> calls;
  HalleySubsetFunction linear = [&c, &calls](
      const Eigen::ArrayXd &x, const std::vector<Eigen::Index> &indices) {
    calls.push_back(indices);
    HalleyEvaluation ev;
    ev.f = Eigen::ArrayXd(x.size());
    for (Eigen::Index j = 0; j < x.size(); ++j)
      ev.f[j] = x[j] - c[indices[static_cast<size_t>(j)]];
    ev.fprime = Eigen::ArrayXd::Ones(x.size());
    ev.fprime2 = Eigen::ArrayXd::Zero(x.size());
    return ev;
  };

  HalleyResult r = solveHalleyBracketed(
      linear, values({3.0, 1.0, 3.0}), Eigen::ArrayXd::Zero(3),
      Eigen::ArrayXd::Constant(3, 4.0), SolverOptions(), "x");

  ASSERT_TRUE(r.allConverged());
  EXPECT_DOUBLE_EQ(r.root[0], 0.0);
  EXPECT_DOUBLE_EQ(r.root[1], 1.0);
  EXPECT_DOUBLE_EQ(r.root[2], 2.0);

  // Two bracket-end evaluations of the full batch, then shrinking subsets.
  const std::vector<Eigen::Index> full = {0, 1, 2};
  ASSERT_EQ(calls.size(), 4u);
  EXPECT_EQ(calls[0], full);
  EXPECT_EQ(calls[1], full);
  EXPECT_EQ(calls[2], (std::vector<Eigen::Index>{1, 2}));
  EXPECT_EQ(calls[3], (std::vector<Eigen::Index>{2}));
}

TEST(HalleyBracketed, BracketSizeMismatchThrows)
{
  EXPECT_THROW(solveHalleyBracketed(onSubset(squareMinus(values({2.0, 3.0}))),
                                    values({1.0, 1.0}), values({0.0}),
                                    values({2.0, 2.0}), SolverOptions(), "x"),
               std::invalid_argument);
}

TEST(HalleyBracketed, DiagnosticsFile)
{
  const std::string path = testing::TempDir() + "halley_bracketed_diag.log";
  std::remove(path.c_str());

  SolverOptions opts;
  opts.diagFile = path;
  opts.diagVerbose = true;
  solveHalleyBracketed(onSubset(arcTangent), values({3.0}), values({-5.0}),
                       values({10.0}), opts, "V_mp_V");

  std::ifstream in(path);
  ASSERT_TRUE(in.good());
  std::stringstream buffer;
  buffer << in.rdbuf();
  const std::string log = buffer.str();

  EXPECT_NE(log.find("V_mp_V iter 1"), std::string::npos);
  EXPECT_NE(log.find("bisections="), std::string::npos);
  EXPECT_NE(log.find("V_mp_V: size=1"), std::string::npos);
  EXPECT_NE(log.find("failed=0"), std::string::npos);

  std::remove(path.c_str());
}

// End of file - no main(): gtest_main supplies the test runner.
