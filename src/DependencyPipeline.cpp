#include "DependencyPipeline.h"
#include "DepInferExceptions.h"
#include "RegressionEnsemble.h"
#include <iostream>

namespace {
void requireSameDrugs(const NamedMatrix& affinity, const NamedMatrix& response) {
    affinity.validateShape("Affinity matrix");
    response.validateShape("Response matrix");
    if (affinity.rowNames != response.rowNames) {
        throw DepInfer::ValidationException("affinity and response matrices must list the same drugs in the same order (" +
                                            std::to_string(affinity.rowCount()) + " vs " +
                                            std::to_string(response.rowCount()) + " rows)");
    }
}
} // namespace

PipelineResult DependencyPipeline::run(const NamedMatrix& affinity,
                                       const NamedMatrix& response,
                                       const PipelineConfig& config,
                                       const RepeatExecutor& executor,
                                       const SparseRegressionSolver& solver) {
    config.validate();
    requireSameDrugs(affinity, response);

    const ReductionResult reduced = SimilarityReducer::reduce(affinity, config.reductionOptions());
    if (config.verbose) {
        std::cout << "[DepInfer][Pipeline] Regressing " << response.colCount() << " samples on "
                  << reduced.matrix.colCount() << " proteins\n";
    }

    const auto repeats = RegressionEnsemble::run(reduced.matrix, response, config.ensembleOptions(), executor, solver);

    PipelineResult result;
    result.aggregate = ResultAggregator::aggregate(repeats, reduced.matrix, response);
    result.groups = reduced.groups;
    result.wardClusterCount = reduced.wardClusterCount;
    return result;
}

PipelineResult DependencyPipeline::run(const NamedMatrix& affinity,
                                       const NamedMatrix& response,
                                       const PipelineConfig& config) {
    MultiResponseLassoSolver solver;
    if (config.parallel) {
        const OpenMPExecutor executor(config.threads);
        return run(affinity, response, config, executor, solver);
    }
    SequentialExecutor executor;
    return run(affinity, response, config, executor, solver);
}
