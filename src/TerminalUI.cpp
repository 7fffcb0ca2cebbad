#include "TerminalUI.h"
#include "CommonUtils.h"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace {
void printSpread(const char* label, const std::vector<double>& values) {
    if (values.empty()) return;
    const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    std::cout << std::left << std::setw(22) << label << std::right << std::scientific << std::setprecision(3)
              << std::setw(12) << *lo
              << std::setw(12) << CommonUtils::medianByNth(values)
              << std::setw(12) << *hi << "\n";
}
} // namespace

void TerminalUI::printInputSummary(const NamedMatrix& affinity, const NamedMatrix& response) {
    std::cout << "\n[DepInfer] Affinity: " << affinity.rowCount() << " drugs x " << affinity.colCount() << " proteins"
              << " | Response: " << response.rowCount() << " drugs x " << response.colCount() << " samples\n";
}

void TerminalUI::printSimilarityGroups(const std::vector<SimilarityGroup>& groups, size_t inputProteins, size_t wardClusters) {
    std::cout << "\n============================================ PROTEIN GROUPS ============================================\n";
    std::cout << "Proteins: " << inputProteins << " -> " << groups.size() << " representatives"
              << " (Ward cut: " << wardClusters << " clusters)\n";
    std::cout << std::string(104, '-') << "\n";

    size_t shown = 0;
    for (const auto& g : groups) {
        if (g.members.size() < 2) continue;
        ++shown;
        std::cout << std::left << std::setw(20) << g.representative
                  << std::right << std::fixed << std::setprecision(3) << std::setw(8) << g.mergeHeight << "  ";
        for (size_t i = 1; i < g.members.size(); ++i) {
            std::cout << (i > 1 ? ", " : "") << g.members[i];
        }
        std::cout << "\n";
    }
    if (shown == 0) std::cout << "No proteins were merged.\n";
    std::cout << std::string(104, '=') << "\n";
}

void TerminalUI::printEnsembleDiagnostics(const AggregatedResult& result) {
    std::cout << "\n============================================ ENSEMBLE ============================================\n";
    std::cout << "Repeats: " << result.lambdaList.size() << "\n";
    std::cout << std::left << std::setw(22) << "" << std::right
              << std::setw(12) << "Min" << std::setw(12) << "Median" << std::setw(12) << "Max" << "\n";
    printSpread("Lambda", result.lambdaList);
    printSpread("Variance explained", result.varianceExplainedList);
    std::cout << std::defaultfloat;
}

void TerminalUI::printTopDependencies(const AggregatedResult& result, size_t k) {
    if (k == 0) return;
    std::cout << "\n============================================ TOP DEPENDENCIES ============================================\n";
    std::cout << std::left << std::setw(20) << "Sample" << std::setw(20) << "Protein"
              << std::right << std::setw(14) << "Coefficient" << std::setw(12) << "Frequency" << "\n";
    std::cout << std::string(66, '-') << "\n";
    for (const auto& sample : result.coefficients.colNames) {
        const auto top = ResultAggregator::topDependencies(result, sample, k);
        if (top.empty()) {
            std::cout << std::left << std::setw(20) << sample << "(no protein selected)\n";
            continue;
        }
        for (size_t i = 0; i < top.size(); ++i) {
            std::cout << std::left << std::setw(20) << (i == 0 ? sample : "") << std::setw(20) << top[i].protein
                      << std::right << std::fixed << std::setprecision(4) << std::setw(14) << top[i].coefficient
                      << std::setprecision(2) << std::setw(12) << top[i].frequency << "\n";
        }
    }
    std::cout << std::defaultfloat;
}
