#include "DepInferExceptions.h"
#include "SparseRegressionSolver.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <random>

namespace {
struct Problem {
    MathUtils::Matrix X;
    MathUtils::Matrix Y;
};

// y0 = 1 + 3 x0 - 2 x2, y1 = 2 x0 + 1.5 x2, plus small noise; x1, x3..x5 are irrelevant.
Problem plantedProblem(size_t n, uint32_t seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> gauss(0.0, 1.0);
    Problem p{MathUtils::Matrix(n, 6), MathUtils::Matrix(n, 2)};
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < 6; ++j) p.X.at(i, j) = gauss(rng);
        p.Y.at(i, 0) = 1.0 + 3.0 * p.X.at(i, 0) - 2.0 * p.X.at(i, 2) + 0.05 * gauss(rng);
        p.Y.at(i, 1) = 2.0 * p.X.at(i, 0) + 1.5 * p.X.at(i, 2) + 0.05 * gauss(rng);
    }
    return p;
}
} // namespace

TEST(MultiResponseLassoSolver, RecoversPlantedSignal) {
    const Problem p = plantedProblem(40, 11);
    MultiResponseLassoSolver solver;
    const SolverFit fit = solver.fit(p.X, p.Y, SolverOptions{}, 5u);

    ASSERT_EQ(fit.coefficients.rows, 6u);
    ASSERT_EQ(fit.coefficients.cols, 2u);
    EXPECT_NEAR(fit.coefficients.at(0, 0), 3.0, 0.25);
    EXPECT_NEAR(fit.coefficients.at(2, 0), -2.0, 0.25);
    EXPECT_NEAR(fit.coefficients.at(0, 1), 2.0, 0.25);
    EXPECT_NEAR(fit.coefficients.at(2, 1), 1.5, 0.25);
    for (size_t j : {1u, 3u, 4u, 5u}) {
        EXPECT_LT(std::abs(fit.coefficients.at(j, 0)), 0.25);
        EXPECT_LT(std::abs(fit.coefficients.at(j, 1)), 0.25);
    }
    EXPECT_NEAR(fit.intercepts[0], 1.0, 0.25);
    EXPECT_GT(fit.varianceExplained, 0.95);
    EXPECT_LE(fit.varianceExplained, 1.0);

    ASSERT_EQ(fit.lambdaPath.size(), 100u);
    EXPECT_EQ(fit.lambda, fit.lambdaPath[fit.lambdaIndex]);
    EXPECT_EQ(fit.cvMean.size(), fit.lambdaPath.size());
    EXPECT_EQ(fit.cvStdErr.size(), fit.lambdaPath.size());
    const double best = *std::min_element(fit.cvMean.begin(), fit.cvMean.end());
    EXPECT_EQ(fit.cvMean[fit.lambdaIndex], best);
}

TEST(MultiResponseLassoSolver, PredictorsEnterForAllResponsesTogether) {
    const Problem p = plantedProblem(40, 3);
    const SolverFit fit = MultiResponseLassoSolver().fit(p.X, p.Y, SolverOptions{}, 9u);
    for (size_t j = 0; j < fit.coefficients.rows; ++j) {
        const bool first = fit.coefficients.at(j, 0) != 0.0;
        const bool second = fit.coefficients.at(j, 1) != 0.0;
        EXPECT_EQ(first, second) << "predictor " << j;
    }
}

TEST(MultiResponseLassoSolver, SameSeedSameFit) {
    const Problem p = plantedProblem(30, 21);
    MultiResponseLassoSolver solver;
    const SolverFit a = solver.fit(p.X, p.Y, SolverOptions{}, 77u);
    const SolverFit b = solver.fit(p.X, p.Y, SolverOptions{}, 77u);
    EXPECT_EQ(a.lambda, b.lambda);
    EXPECT_EQ(a.coefficients.data, b.coefficients.data);
    EXPECT_EQ(a.varianceExplained, b.varianceExplained);
}

TEST(MultiResponseLassoSolver, OneStandardErrorRulePrefersLargerPenalty) {
    const Problem p = plantedProblem(30, 8);
    SolverOptions minRule;
    SolverOptions seRule;
    seRule.rule = LambdaRule::ONE_SE;
    MultiResponseLassoSolver solver;
    const SolverFit a = solver.fit(p.X, p.Y, minRule, 4u);
    const SolverFit b = solver.fit(p.X, p.Y, seRule, 4u);
    EXPECT_GE(b.lambda, a.lambda);
    EXPECT_LE(b.cvMean[b.lambdaIndex], a.cvMean[a.lambdaIndex] + a.cvStdErr[a.lambdaIndex] + 1e-12);
}

TEST(MultiResponseLassoSolver, StandardizedFitStaysOnInputScale) {
    Problem p = plantedProblem(40, 13);
    for (size_t i = 0; i < p.X.rows; ++i) p.X.at(i, 0) *= 10.0;
    SolverOptions options;
    options.standardize = true;
    const SolverFit fit = MultiResponseLassoSolver().fit(p.X, p.Y, options, 2u);
    EXPECT_NEAR(fit.coefficients.at(0, 0), 0.3, 0.03);
    EXPECT_NEAR(fit.coefficients.at(2, 0), -2.0, 0.25);
}

TEST(MultiResponseLassoSolver, LambdaSequenceIsDecreasingLogGrid) {
    const Problem p = plantedProblem(20, 1);
    SolverOptions options;
    options.nLambda = 10;
    options.lambdaMinRatio = 0.01;
    const auto path = MultiResponseLassoSolver::lambdaSequence(p.X, p.Y, options);
    ASSERT_EQ(path.size(), 10u);
    for (size_t i = 1; i < path.size(); ++i) EXPECT_LT(path[i], path[i - 1]);
    EXPECT_NEAR(path.back() / path.front(), 0.01, 1e-12);
}

TEST(MultiResponseLassoSolver, AllZeroAtLambdaMax) {
    const Problem p = plantedProblem(30, 5);
    SolverOptions options;
    options.nLambda = 1;
    const SolverFit fit = MultiResponseLassoSolver().fit(p.X, p.Y, options, 1u);
    for (const auto& row : fit.coefficients.data) {
        for (double v : row) EXPECT_EQ(v, 0.0);
    }
    EXPECT_NEAR(fit.varianceExplained, 0.0, 1e-12);
}

TEST(MultiResponseLassoSolver, FoldsAreBalancedAndSeeded) {
    const auto a = MultiResponseLassoSolver::assignFolds(10, 3, 42u);
    const auto b = MultiResponseLassoSolver::assignFolds(10, 3, 42u);
    EXPECT_EQ(a, b);
    ASSERT_EQ(a.size(), 10u);
    EXPECT_EQ(std::count(a.begin(), a.end(), 0), 4);
    EXPECT_EQ(std::count(a.begin(), a.end(), 1), 3);
    EXPECT_EQ(std::count(a.begin(), a.end(), 2), 3);
}

TEST(MultiResponseLassoSolver, RejectsUnfittableProblems) {
    MultiResponseLassoSolver solver;
    const Problem p = plantedProblem(10, 2);

    MathUtils::Matrix tinyX(2, 2, 1.0);
    MathUtils::Matrix tinyY(2, 1, 1.0);
    tinyX.at(1, 0) = 2.0;
    tinyY.at(1, 0) = 3.0;
    EXPECT_THROW(solver.fit(tinyX, tinyY, SolverOptions{}, 1u), DepInfer::SolverException);

    MathUtils::Matrix constantY(10, 2, 4.0);
    EXPECT_THROW(solver.fit(p.X, constantY, SolverOptions{}, 1u), DepInfer::SolverException);

    MathUtils::Matrix shortY(9, 2, 1.0);
    EXPECT_THROW(solver.fit(p.X, shortY, SolverOptions{}, 1u), DepInfer::SolverException);

    SolverOptions twoFolds;
    twoFolds.folds = 2;
    EXPECT_THROW(solver.fit(p.X, p.Y, twoFolds, 1u), DepInfer::SolverException);

    SolverOptions starved;
    starved.maxIterations = 1;
    starved.tolerance = 1e-300;
    EXPECT_THROW(solver.fit(p.X, p.Y, starved, 1u), DepInfer::SolverException);
}
