#pragma once
#include "MathUtils.h"
#include <cstddef>
#include <cstdint>
#include <vector>

enum class LambdaRule { MIN, ONE_SE };

struct SolverOptions {
    int folds = 3;
    LambdaRule rule = LambdaRule::MIN;
    bool standardize = false;
    size_t nLambda = 100;
    double lambdaMinRatio = -1.0; // -1 => 0.01 when rows < predictors, else 1e-4
    double tolerance = 1e-7;
    int maxIterations = 100000;
};

struct SolverFit {
    MathUtils::Matrix coefficients; // predictors x responses
    std::vector<double> intercepts;
    double lambda = 0.0;
    double varianceExplained = 0.0;
    size_t lambdaIndex = 0;
    std::vector<double> lambdaPath;
    std::vector<double> cvMean;
    std::vector<double> cvStdErr;
};

// Cross-validated sparse multivariate linear regression.
class SparseRegressionSolver {
public:
    virtual ~SparseRegressionSolver() = default;

    /**
     * @brief Fits Y ~ X with a cross-validated penalty.
     * @pre X.rows == Y.rows; all entries finite.
     * @throws DepInfer::SolverException when the problem cannot be fitted.
     */
    virtual SolverFit fit(const MathUtils::Matrix& X,
                          const MathUtils::Matrix& Y,
                          const SolverOptions& options,
                          uint32_t seed) const = 0;
};

/**
 * Multi-response Gaussian lasso: minimises
 *   (1/2n) ||Yc - Xc B||_F^2 + lambda * sum_j ||B_j||_2
 * by block coordinate descent with covariance updates, so a predictor enters or
 * leaves the model for all responses at once.
 */
class MultiResponseLassoSolver : public SparseRegressionSolver {
public:
    SolverFit fit(const MathUtils::Matrix& X,
                  const MathUtils::Matrix& Y,
                  const SolverOptions& options,
                  uint32_t seed) const override;

    /**
     * @brief Decreasing log-spaced penalty path starting at the smallest lambda with an all-zero fit.
     * @throws DepInfer::SolverException when X'Y vanishes (nothing to fit).
     */
    static std::vector<double> lambdaSequence(const MathUtils::Matrix& X,
                                              const MathUtils::Matrix& Y,
                                              const SolverOptions& options);

    /**
     * @brief Fold id (0..folds-1) per row: a seeded shuffle of balanced labels.
     */
    static std::vector<int> assignFolds(size_t rows, int folds, uint32_t seed);
};
