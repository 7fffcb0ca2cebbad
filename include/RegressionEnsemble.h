#pragma once
#include "MathUtils.h"
#include "NamedMatrix.h"
#include "RepeatExecutor.h"
#include "SparseRegressionSolver.h"
#include <cstddef>
#include <cstdint>
#include <vector>

// One cross-validated fit of the full response matrix.
struct RawRepeatResult {
    size_t repeatIndex = 0;
    MathUtils::Matrix coefficients; // proteins x samples
    double lambda = 0.0;
    double varianceExplained = 0.0;
};

struct EnsembleOptions {
    size_t repeats = 100;
    uint32_t seed = 1337;
    SolverOptions solver;
    bool verbose = false;
};

class RegressionEnsemble {
public:
    /**
     * @brief Fits Y ~ X once per repeat, each repeat with its own fold assignment.
     * @pre X and Y rows are the same drugs in the same order.
     * @post result[i].repeatIndex == i regardless of which worker finished first.
     * @throws DepInfer::ValidationException on misaligned or non-finite input.
     * @throws DepInfer::SolverException (or whatever the solver raised) for the lowest failing repeat.
     */
    static std::vector<RawRepeatResult> run(const NamedMatrix& X,
                                            const NamedMatrix& Y,
                                            const EnsembleOptions& options,
                                            const RepeatExecutor& executor,
                                            const SparseRegressionSolver& solver);

    // Seed handed to the solver for repeat `index`.
    static uint32_t repeatSeed(uint32_t seed, size_t index);

    /**
     * @throws DepInfer::ValidationException describing the first problem found.
     */
    static void validateInputs(const NamedMatrix& X, const NamedMatrix& Y, const EnsembleOptions& options);
};
