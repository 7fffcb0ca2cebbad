#include "RegressionEnsemble.h"
#include "DepInferExceptions.h"
#include <cmath>
#include <iostream>
#include <string>

namespace {
void requireFinite(const NamedMatrix& m, const std::string& label) {
    for (size_t r = 0; r < m.rowCount(); ++r) {
        for (size_t c = 0; c < m.colCount(); ++c) {
            if (!std::isfinite(m.at(r, c))) {
                throw DepInfer::ValidationException(label + " has a missing or non-finite value at drug '" +
                                                    m.rowNames[r] + "', column '" + m.colNames[c] + "'");
            }
        }
    }
}
} // namespace

uint32_t RegressionEnsemble::repeatSeed(uint32_t seed, size_t index) {
    return static_cast<uint32_t>(seed + index * 104729u + 31u);
}

void RegressionEnsemble::validateInputs(const NamedMatrix& X, const NamedMatrix& Y, const EnsembleOptions& options) {
    if (options.repeats < 1) {
        throw DepInfer::ValidationException("repeats must be at least 1");
    }
    if (options.solver.folds < 3) {
        throw DepInfer::ValidationException("folds must be at least 3, got " + std::to_string(options.solver.folds));
    }
    X.validateShape("Affinity matrix");
    Y.validateShape("Response matrix");
    if (X.rowCount() != Y.rowCount()) {
        throw DepInfer::ValidationException("Affinity matrix has " + std::to_string(X.rowCount()) +
                                            " drugs but response matrix has " + std::to_string(Y.rowCount()));
    }
    for (size_t r = 0; r < X.rowCount(); ++r) {
        if (X.rowNames[r] != Y.rowNames[r]) {
            throw DepInfer::ValidationException("drug order differs at row " + std::to_string(r + 1) + ": '" +
                                                X.rowNames[r] + "' vs '" + Y.rowNames[r] + "'");
        }
    }
    requireFinite(X, "Affinity matrix");
    requireFinite(Y, "Response matrix");
}

std::vector<RawRepeatResult> RegressionEnsemble::run(const NamedMatrix& X,
                                                     const NamedMatrix& Y,
                                                     const EnsembleOptions& options,
                                                     const RepeatExecutor& executor,
                                                     const SparseRegressionSolver& solver) {
    validateInputs(X, Y, options);

    if (options.verbose) {
        std::cout << "[DepInfer][Ensemble] " << options.repeats << " repeats of " << options.solver.folds
                  << "-fold CV on " << X.rowCount() << " drugs, " << X.colCount() << " proteins, "
                  << Y.colCount() << " samples\n";
    }

    std::vector<RawRepeatResult> results(options.repeats);
    executor.forEachIndex(options.repeats, [&](size_t i) {
        const SolverFit fit = solver.fit(X.values, Y.values, options.solver, repeatSeed(options.seed, i));
        RawRepeatResult& slot = results[i];
        slot.repeatIndex = i;
        slot.coefficients = fit.coefficients;
        slot.lambda = fit.lambda;
        slot.varianceExplained = fit.varianceExplained;
    });

    if (options.verbose) {
        std::cout << "[DepInfer][Ensemble] Completed " << results.size() << " repeats\n";
    }
    return results;
}
