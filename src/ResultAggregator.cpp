#include "ResultAggregator.h"
#include "CommonUtils.h"
#include "DepInferExceptions.h"
#include <algorithm>
#include <cmath>
#include <string>

AggregatedResult ResultAggregator::aggregate(std::vector<RawRepeatResult> results, const NamedMatrix& X, const NamedMatrix& Y) {
    if (results.empty()) {
        throw DepInfer::ValidationException("no repeat results to aggregate");
    }
    const size_t p = X.colCount();
    const size_t k = Y.colCount();
    for (const auto& r : results) {
        if (r.coefficients.rows != p || r.coefficients.cols != k) {
            throw DepInfer::ValidationException("repeat " + std::to_string(r.repeatIndex) + " has a " +
                                                std::to_string(r.coefficients.rows) + "x" +
                                                std::to_string(r.coefficients.cols) + " coefficient matrix, expected " +
                                                std::to_string(p) + "x" + std::to_string(k));
        }
    }
    std::stable_sort(results.begin(), results.end(), [](const RawRepeatResult& a, const RawRepeatResult& b) {
        return a.repeatIndex < b.repeatIndex;
    });

    AggregatedResult out;
    out.coefficients = NamedMatrix(X.colNames, Y.colNames);
    out.frequency = NamedMatrix(X.colNames, Y.colNames);
    const double repeats = static_cast<double>(results.size());

    std::vector<double> cell(results.size(), 0.0);
    for (size_t i = 0; i < p; ++i) {
        for (size_t j = 0; j < k; ++j) {
            size_t nonZero = 0;
            for (size_t r = 0; r < results.size(); ++r) {
                cell[r] = results[r].coefficients.at(i, j);
                if (cell[r] != 0.0) ++nonZero;
            }
            out.coefficients.at(i, j) = CommonUtils::medianByNth(cell);
            out.frequency.at(i, j) = static_cast<double>(nonZero) / repeats;
        }
    }

    out.lambdaList.reserve(results.size());
    out.varianceExplainedList.reserve(results.size());
    for (const auto& r : results) {
        out.lambdaList.push_back(r.lambda);
        out.varianceExplainedList.push_back(r.varianceExplained);
    }
    out.inputX = X;
    out.inputY = Y;
    return out;
}

std::vector<DependencyEntry> ResultAggregator::topDependencies(const AggregatedResult& result,
                                                               const std::string& sample,
                                                               size_t k) {
    const auto col = result.coefficients.columnIndex(sample);
    if (!col) {
        throw DepInfer::ValidationException("unknown sample '" + sample + "'");
    }

    std::vector<DependencyEntry> entries;
    for (size_t i = 0; i < result.coefficients.rowCount(); ++i) {
        const double coef = result.coefficients.at(i, *col);
        if (coef == 0.0) continue;
        entries.push_back({result.coefficients.rowNames[i], coef, result.frequency.at(i, *col)});
    }
    std::stable_sort(entries.begin(), entries.end(), [](const DependencyEntry& a, const DependencyEntry& b) {
        if (std::abs(a.coefficient) != std::abs(b.coefficient)) return std::abs(a.coefficient) > std::abs(b.coefficient);
        return a.frequency > b.frequency;
    });
    if (entries.size() > k) entries.resize(k);
    return entries;
}
