#pragma once
#include "NamedMatrix.h"
#include "RegressionEnsemble.h"
#include <cstddef>
#include <string>
#include <vector>

struct AggregatedResult {
    NamedMatrix coefficients; // proteins x samples, median over repeats
    NamedMatrix frequency;    // proteins x samples, share of repeats with a non-zero coefficient
    std::vector<double> lambdaList;
    std::vector<double> varianceExplainedList;
    NamedMatrix inputX;
    NamedMatrix inputY;
};

struct DependencyEntry {
    std::string protein;
    double coefficient = 0.0;
    double frequency = 0.0;
};

class ResultAggregator {
public:
    /**
     * @brief Collapses repeat results into consensus statistics.
     * @post Lists follow repeat-index order; matrix axes are X columns by Y columns.
     * @throws DepInfer::ValidationException on an empty list or mismatched repeat dimensions.
     */
    static AggregatedResult aggregate(std::vector<RawRepeatResult> results, const NamedMatrix& X, const NamedMatrix& Y);

    /**
     * @brief Strongest proteins for one sample, by |coefficient| then frequency.
     * Proteins with a zero consensus coefficient are left out.
     * @throws DepInfer::ValidationException for an unknown sample.
     */
    static std::vector<DependencyEntry> topDependencies(const AggregatedResult& result,
                                                        const std::string& sample,
                                                        size_t k);
};
