#include "SparseRegressionSolver.h"
#include "DepInferExceptions.h"
#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>
#include <random>
#include <string>

namespace {
constexpr double kSmallSampleLambdaRatio = 1e-2;
constexpr double kLargeSampleLambdaRatio = 1e-4;
constexpr double kScaleFloor = 1e-12;

// Centred (optionally scaled) sufficient statistics of one training subset.
struct CenteredProblem {
    size_t n = 0;
    size_t p = 0;
    size_t k = 0;
    std::vector<double> xMean;
    std::vector<double> xScale;
    std::vector<double> yMean;
    MathUtils::Matrix gram;  // Xc' Xc
    MathUtils::Matrix cross; // Xc' Yc
    double nullDeviance = 0.0;
};

CenteredProblem prepare(const MathUtils::Matrix& X,
                        const MathUtils::Matrix& Y,
                        const std::vector<size_t>& rows,
                        bool standardize) {
    CenteredProblem prob;
    prob.n = rows.size();
    prob.p = X.cols;
    prob.k = Y.cols;
    prob.xMean.assign(prob.p, 0.0);
    prob.xScale.assign(prob.p, 1.0);
    prob.yMean.assign(prob.k, 0.0);

    const double n = static_cast<double>(prob.n);
    for (size_t r : rows) {
        for (size_t j = 0; j < prob.p; ++j) prob.xMean[j] += X.at(r, j);
        for (size_t c = 0; c < prob.k; ++c) prob.yMean[c] += Y.at(r, c);
    }
    for (double& m : prob.xMean) m /= n;
    for (double& m : prob.yMean) m /= n;

    MathUtils::Matrix xc(prob.n, prob.p);
    MathUtils::Matrix yc(prob.n, prob.k);
    for (size_t i = 0; i < prob.n; ++i) {
        const size_t r = rows[i];
        for (size_t j = 0; j < prob.p; ++j) xc.at(i, j) = X.at(r, j) - prob.xMean[j];
        for (size_t c = 0; c < prob.k; ++c) {
            yc.at(i, c) = Y.at(r, c) - prob.yMean[c];
            prob.nullDeviance += yc.at(i, c) * yc.at(i, c);
        }
    }

    if (standardize) {
        for (size_t j = 0; j < prob.p; ++j) {
            double ss = 0.0;
            for (size_t i = 0; i < prob.n; ++i) ss += xc.at(i, j) * xc.at(i, j);
            const double sd = std::sqrt(ss / n);
            if (sd > kScaleFloor) prob.xScale[j] = sd;
        }
        for (size_t i = 0; i < prob.n; ++i) {
            for (size_t j = 0; j < prob.p; ++j) xc.at(i, j) /= prob.xScale[j];
        }
    }

    const MathUtils::Matrix xt = xc.transpose();
    prob.gram = xt.multiply(xc);
    prob.cross = xt.multiply(yc);
    return prob;
}

// Same arithmetic as the first coordinate update, so every coefficient is exactly zero at lambdaMax.
double lambdaMax(const CenteredProblem& prob) {
    const double n = static_cast<double>(prob.n);
    std::vector<double> grad(prob.k, 0.0);
    double best = 0.0;
    for (size_t j = 0; j < prob.p; ++j) {
        for (size_t c = 0; c < prob.k; ++c) grad[c] = prob.cross.at(j, c) / n;
        best = std::max(best, MathUtils::norm2(grad));
    }
    return best;
}

using PathVisitor = std::function<void(size_t lambdaIdx, const MathUtils::Matrix& beta, const std::vector<size_t>& active)>;

/**
 * Solves the penalised problem at lambdas[0..lastIdx] with warm starts and hands
 * each solution (on the centred/scaled predictor scale) to `visit`.
 */
void solvePath(const CenteredProblem& prob,
               const std::vector<double>& lambdas,
               size_t lastIdx,
               const SolverOptions& options,
               const PathVisitor& visit) {
    const double n = static_cast<double>(prob.n);
    MathUtils::Matrix beta(prob.p, prob.k);
    std::vector<size_t> active;
    std::vector<bool> isActive(prob.p, false);
    std::vector<double> grad(prob.k, 0.0);
    const double threshold = options.tolerance * prob.nullDeviance / n;

    for (size_t li = 0; li <= lastIdx && li < lambdas.size(); ++li) {
        const double lambda = lambdas[li];
        int sweeps = 0;
        while (true) {
            if (++sweeps > options.maxIterations) {
                throw DepInfer::SolverException("coordinate descent did not converge within " +
                                                std::to_string(options.maxIterations) +
                                                " sweeps at lambda " + std::to_string(lambda));
            }
            double maxChange = 0.0;
            for (size_t j = 0; j < prob.p; ++j) {
                const double xv = prob.gram.at(j, j) / n;
                if (xv <= 0.0) continue;

                for (size_t c = 0; c < prob.k; ++c) grad[c] = prob.cross.at(j, c);
                for (size_t l : active) {
                    const double g = prob.gram.at(j, l);
                    const auto& bl = beta.data[l];
                    for (size_t c = 0; c < prob.k; ++c) grad[c] -= g * bl[c];
                }
                auto& bj = beta.data[j];
                for (size_t c = 0; c < prob.k; ++c) grad[c] = grad[c] / n + xv * bj[c];

                const double gnorm = MathUtils::norm2(grad);
                const double shrink = (gnorm > lambda) ? (1.0 - lambda / gnorm) / xv : 0.0;
                double delta2 = 0.0;
                for (size_t c = 0; c < prob.k; ++c) {
                    const double updated = grad[c] * shrink;
                    const double d = updated - bj[c];
                    delta2 += d * d;
                    bj[c] = updated;
                }
                if (delta2 > 0.0) {
                    maxChange = std::max(maxChange, xv * delta2);
                    if (!isActive[j]) {
                        isActive[j] = true;
                        active.push_back(j);
                    }
                }
            }
            if (maxChange <= threshold) break;
        }
        visit(li, beta, active);
    }
}

double residualSumOfSquares(const CenteredProblem& prob, const MathUtils::Matrix& beta, const std::vector<size_t>& active) {
    double rss = prob.nullDeviance;
    for (size_t l : active) {
        rss -= 2.0 * MathUtils::dot(prob.cross.data[l], beta.data[l]);
        for (size_t m : active) {
            rss += prob.gram.at(l, m) * MathUtils::dot(beta.data[l], beta.data[m]);
        }
    }
    return std::max(0.0, rss);
}
} // namespace

std::vector<int> MultiResponseLassoSolver::assignFolds(size_t rows, int folds, uint32_t seed) {
    std::vector<int> ids(rows, 0);
    for (size_t i = 0; i < rows; ++i) ids[i] = static_cast<int>(i % static_cast<size_t>(folds));
    std::mt19937 rng(seed);
    std::shuffle(ids.begin(), ids.end(), rng);
    return ids;
}

std::vector<double> MultiResponseLassoSolver::lambdaSequence(const MathUtils::Matrix& X,
                                                             const MathUtils::Matrix& Y,
                                                             const SolverOptions& options) {
    std::vector<size_t> all(X.rows);
    std::iota(all.begin(), all.end(), 0);
    const CenteredProblem prob = prepare(X, Y, all, options.standardize);
    const double top = lambdaMax(prob);
    if (!(top > 0.0) || !std::isfinite(top)) {
        throw DepInfer::SolverException("predictors carry no signal for the responses (X'Y vanishes); "
                                        "check for constant responses or predictors");
    }

    const double ratio = (options.lambdaMinRatio > 0.0)
        ? options.lambdaMinRatio
        : (X.rows < X.cols ? kSmallSampleLambdaRatio : kLargeSampleLambdaRatio);
    const size_t count = std::max<size_t>(1, options.nLambda);
    std::vector<double> lambdas(count, top);
    for (size_t i = 1; i < count; ++i) {
        const double frac = static_cast<double>(i) / static_cast<double>(count - 1);
        lambdas[i] = top * std::pow(ratio, frac);
    }
    return lambdas;
}

SolverFit MultiResponseLassoSolver::fit(const MathUtils::Matrix& X,
                                        const MathUtils::Matrix& Y,
                                        const SolverOptions& options,
                                        uint32_t seed) const {
    if (X.rows != Y.rows) {
        throw DepInfer::SolverException("predictor and response row counts differ (" +
                                        std::to_string(X.rows) + " vs " + std::to_string(Y.rows) + ")");
    }
    if (X.cols == 0 || Y.cols == 0) {
        throw DepInfer::SolverException("at least one predictor and one response are required");
    }
    if (!MathUtils::allFinite(X) || !MathUtils::allFinite(Y)) {
        throw DepInfer::SolverException("inputs contain missing or non-finite values");
    }
    if (options.folds < 3) {
        throw DepInfer::SolverException("cross-validation needs at least 3 folds");
    }
    const size_t n = X.rows;
    if (n < static_cast<size_t>(options.folds)) {
        throw DepInfer::SolverException("only " + std::to_string(n) + " observations for " +
                                        std::to_string(options.folds) + "-fold cross-validation");
    }

    std::vector<size_t> allRows(n);
    std::iota(allRows.begin(), allRows.end(), 0);
    const CenteredProblem full = prepare(X, Y, allRows, options.standardize);
    if (!(full.nullDeviance > 0.0)) {
        throw DepInfer::SolverException("response matrix has zero variance");
    }

    SolverFit result;
    result.lambdaPath = lambdaSequence(X, Y, options);
    const size_t nl = result.lambdaPath.size();

    // Cross-validated error per lambda: mean over held-out rows of the squared error summed over responses.
    const std::vector<int> foldIds = assignFolds(n, options.folds, seed);
    std::vector<std::vector<double>> foldError(static_cast<size_t>(options.folds), std::vector<double>(nl, 0.0));
    std::vector<double> foldSize(static_cast<size_t>(options.folds), 0.0);

    for (int f = 0; f < options.folds; ++f) {
        std::vector<size_t> trainRows;
        std::vector<size_t> testRows;
        for (size_t i = 0; i < n; ++i) {
            if (foldIds[i] == f) testRows.push_back(i);
            else trainRows.push_back(i);
        }
        if (trainRows.size() < 2 || testRows.empty()) {
            throw DepInfer::SolverException("degenerate cross-validation fold " + std::to_string(f + 1) +
                                            " (" + std::to_string(trainRows.size()) + " training rows)");
        }
        foldSize[static_cast<size_t>(f)] = static_cast<double>(testRows.size());

        const CenteredProblem train = prepare(X, Y, trainRows, options.standardize);
        auto& errors = foldError[static_cast<size_t>(f)];
        solvePath(train, result.lambdaPath, nl - 1, options,
                  [&](size_t li, const MathUtils::Matrix& beta, const std::vector<size_t>& active) {
            double sse = 0.0;
            for (size_t r : testRows) {
                for (size_t c = 0; c < train.k; ++c) {
                    double pred = train.yMean[c];
                    for (size_t l : active) {
                        pred += (X.at(r, l) - train.xMean[l]) / train.xScale[l] * beta.at(l, c);
                    }
                    const double d = Y.at(r, c) - pred;
                    sse += d * d;
                }
            }
            errors[li] = sse / static_cast<double>(testRows.size());
        });
    }

    result.cvMean.assign(nl, 0.0);
    result.cvStdErr.assign(nl, 0.0);
    const double total = static_cast<double>(n);
    for (size_t li = 0; li < nl; ++li) {
        double mean = 0.0;
        for (size_t f = 0; f < foldError.size(); ++f) mean += foldSize[f] * foldError[f][li];
        mean /= total;
        double var = 0.0;
        for (size_t f = 0; f < foldError.size(); ++f) {
            const double d = foldError[f][li] - mean;
            var += foldSize[f] * d * d;
        }
        var /= total * static_cast<double>(foldError.size() - 1);
        result.cvMean[li] = mean;
        result.cvStdErr[li] = std::sqrt(var);
    }

    // Ties resolve to the larger penalty (earlier in the path).
    size_t best = 0;
    for (size_t li = 1; li < nl; ++li) {
        if (result.cvMean[li] < result.cvMean[best]) best = li;
    }
    size_t chosen = best;
    if (options.rule == LambdaRule::ONE_SE) {
        const double limit = result.cvMean[best] + result.cvStdErr[best];
        for (size_t li = 0; li <= best; ++li) {
            if (result.cvMean[li] <= limit) {
                chosen = li;
                break;
            }
        }
    }
    result.lambdaIndex = chosen;
    result.lambda = result.lambdaPath[chosen];

    result.coefficients = MathUtils::Matrix(full.p, full.k);
    result.intercepts = full.yMean;
    solvePath(full, result.lambdaPath, chosen, options,
              [&](size_t li, const MathUtils::Matrix& beta, const std::vector<size_t>& active) {
        if (li != chosen) return;
        for (size_t l : active) {
            for (size_t c = 0; c < full.k; ++c) {
                const double coef = beta.at(l, c) / full.xScale[l];
                result.coefficients.at(l, c) = coef;
                result.intercepts[c] -= full.xMean[l] * coef;
            }
        }
        result.varianceExplained = 1.0 - residualSumOfSquares(full, beta, active) / full.nullDeviance;
    });

    return result;
}
