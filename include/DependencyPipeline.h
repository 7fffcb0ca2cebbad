#pragma once
#include "NamedMatrix.h"
#include "PipelineConfig.h"
#include "RepeatExecutor.h"
#include "ResultAggregator.h"
#include "SimilarityReducer.h"
#include "SparseRegressionSolver.h"
#include <cstddef>
#include <vector>

struct PipelineResult {
    AggregatedResult aggregate;
    std::vector<SimilarityGroup> groups;
    size_t wardClusterCount = 0;
};

class DependencyPipeline {
public:
    /**
     * @brief Preprocesses the affinity matrix, runs the regression ensemble and aggregates it.
     * @pre affinity and response list the same drugs in the same row order.
     * @throws DepInfer::ConfigurationException, DepInfer::ValidationException or
     *         DepInfer::SolverException; nothing is computed past the first failure.
     */
    static PipelineResult run(const NamedMatrix& affinity,
                              const NamedMatrix& response,
                              const PipelineConfig& config,
                              const RepeatExecutor& executor,
                              const SparseRegressionSolver& solver);

    // Uses MultiResponseLassoSolver and an OpenMP or sequential executor per `config.parallel`.
    static PipelineResult run(const NamedMatrix& affinity,
                              const NamedMatrix& response,
                              const PipelineConfig& config);
};
