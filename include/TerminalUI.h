#pragma once
#include "DependencyPipeline.h"
#include "NamedMatrix.h"
#include "SimilarityReducer.h"
#include <cstddef>
#include <vector>

class TerminalUI {
public:
    static void printInputSummary(const NamedMatrix& affinity, const NamedMatrix& response);

    // Only groups that absorbed at least one protein are listed.
    static void printSimilarityGroups(const std::vector<SimilarityGroup>& groups, size_t inputProteins, size_t wardClusters);
    static void printEnsembleDiagnostics(const AggregatedResult& result);
    static void printTopDependencies(const AggregatedResult& result, size_t k);
};
