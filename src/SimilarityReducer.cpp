#include "SimilarityReducer.h"
#include "DepInferExceptions.h"
#include "HierarchicalClustering.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <unordered_set>

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kSquashShift = 2.0;
constexpr double kSquashGain = 3.0;
// Identical columns may land a few ulps below 1 after normalisation.
constexpr double kSimilarityTolerance = 1e-12;

void validateInput(const NamedMatrix& affinity, const ReductionOptions& options) {
    affinity.validateShape("Affinity matrix");

    if (!std::isfinite(options.cutoff) || options.cutoff < 0.0 || options.cutoff > 1.0) {
        throw DepInfer::ValidationException("cutoff must be within [0,1], got " + std::to_string(options.cutoff));
    }

    std::unordered_set<std::string> seen;
    for (const auto& id : options.keep) {
        if (!seen.insert(id).second) {
            throw DepInfer::ValidationException("keep lists protein '" + id + "' more than once");
        }
        if (!affinity.columnIndex(id)) {
            throw DepInfer::ValidationException("keep references unknown protein '" + id + "'");
        }
    }

    for (size_t r = 0; r < affinity.rowCount(); ++r) {
        for (size_t c = 0; c < affinity.colCount(); ++c) {
            const double v = affinity.at(r, c);
            if (options.transform) {
                if (std::isnan(v)) continue;
                if (!std::isfinite(v) || v <= 0.0) {
                    throw DepInfer::ValidationException("Affinity value for drug '" + affinity.rowNames[r] +
                                                        "' and protein '" + affinity.colNames[c] +
                                                        "' must be a positive dissociation constant");
                }
            } else if (!std::isfinite(v)) {
                throw DepInfer::ValidationException("Affinity matrix has a missing or non-finite value for drug '" +
                                                    affinity.rowNames[r] + "' and protein '" + affinity.colNames[c] +
                                                    "'; missing values require transform");
            }
        }
    }
}

MathUtils::Matrix similarityToDistance(const MathUtils::Matrix& similarity) {
    MathUtils::Matrix dist(similarity.rows, similarity.cols);
    for (size_t i = 0; i < similarity.rows; ++i) {
        for (size_t j = 0; j < similarity.cols; ++j) {
            dist.at(i, j) = (i == j) ? 0.0 : std::max(0.0, 1.0 - similarity.at(i, j));
        }
    }
    return dist;
}
} // namespace

double SimilarityReducer::squashAffinity(double pAffinity) {
    return (std::atan((pAffinity + kSquashShift) * kSquashGain) + kPi / 2.0) / kPi;
}

NamedMatrix SimilarityReducer::transformAffinity(const NamedMatrix& affinity) {
    NamedMatrix out = affinity;
    for (auto& row : out.values.data) {
        for (double& v : row) {
            const double pAffinity = std::isnan(v) ? kMissingAffinity : -std::log10(v);
            v = squashAffinity(pAffinity);
        }
    }
    return out;
}

std::vector<size_t> SimilarityReducer::priorityOrder(const NamedMatrix& affinity, const std::vector<std::string>& keep) {
    const std::vector<double> strength = MathUtils::columnSums(affinity.values);
    std::vector<size_t> order(affinity.colCount());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return strength[a] > strength[b];
    });
    if (keep.empty()) return order;

    std::vector<size_t> front;
    front.reserve(keep.size());
    for (const auto& id : keep) {
        const auto idx = affinity.columnIndex(id);
        if (!idx) throw DepInfer::ValidationException("keep references unknown protein '" + id + "'");
        front.push_back(*idx);
    }
    std::vector<size_t> result = front;
    for (size_t idx : order) {
        if (std::find(front.begin(), front.end(), idx) == front.end()) result.push_back(idx);
    }
    return result;
}

std::vector<std::vector<size_t>> SimilarityReducer::groupByPriority(const MathUtils::Matrix& similarity,
                                                                    const std::vector<size_t>& priority,
                                                                    const std::vector<bool>& protectedColumns,
                                                                    double cutoff) {
    std::vector<std::vector<size_t>> groups;
    std::vector<bool> assigned(similarity.rows, false);
    for (size_t pos = 0; pos < priority.size(); ++pos) {
        const size_t rep = priority[pos];
        if (assigned[rep]) continue;
        assigned[rep] = true;
        std::vector<size_t> group{rep};
        for (size_t later = pos + 1; later < priority.size(); ++later) {
            const size_t cand = priority[later];
            if (assigned[cand] || protectedColumns[cand]) continue;
            if (similarity.at(rep, cand) >= cutoff - kSimilarityTolerance) {
                assigned[cand] = true;
                group.push_back(cand);
            }
        }
        groups.push_back(std::move(group));
    }
    return groups;
}

ReductionResult SimilarityReducer::reduce(const NamedMatrix& affinity, const ReductionOptions& options) {
    validateInput(affinity, options);

    ReductionResult result;
    result.matrix = options.transform ? transformAffinity(affinity) : affinity;
    if (options.verbose && options.transform) {
        std::cout << "[DepInfer][Reduce] Transformed " << affinity.rowCount() << "x" << affinity.colCount()
                  << " dissociation constants to bounded affinity scores\n";
    }
    if (!options.dedupe) return result;

    const NamedMatrix& scored = result.matrix;
    const size_t p = scored.colCount();
    const MathUtils::Matrix similarity = MathUtils::cosineSimilarity(scored.values);
    const std::vector<size_t> priority = priorityOrder(scored, options.keep);

    std::vector<bool> protectedColumns(p, false);
    for (const auto& id : options.keep) protectedColumns[*scored.columnIndex(id)] = true;

    const Dendrogram tree = HierarchicalClustering::wardLinkage(similarityToDistance(similarity));
    const std::vector<size_t> wardLabels = tree.cut(1.0 - options.cutoff);
    result.wardClusterCount = wardLabels.empty() ? 0 : *std::max_element(wardLabels.begin(), wardLabels.end()) + 1;

    std::vector<size_t> leafPosition(p, 0);
    const std::vector<size_t> leaves = tree.leafOrder();
    for (size_t i = 0; i < leaves.size(); ++i) leafPosition[leaves[i]] = i;

    const auto groups = groupByPriority(similarity, priority, protectedColumns, options.cutoff);
    if (p > 1 && groups.size() == 1) {
        throw DepInfer::DegenerateClusterException(
            "all " + std::to_string(p) + " proteins collapsed into a single group at cutoff " +
            std::to_string(options.cutoff));
    }

    std::vector<size_t> representatives;
    representatives.reserve(groups.size());
    result.groups.reserve(groups.size());
    for (const auto& group : groups) {
        std::vector<size_t> members(group.begin() + 1, group.end());
        std::sort(members.begin(), members.end(), [&](size_t a, size_t b) {
            return leafPosition[a] < leafPosition[b];
        });
        members.insert(members.begin(), group.front());

        SimilarityGroup record;
        record.representative = scored.colNames[group.front()];
        for (size_t idx : members) record.members.push_back(scored.colNames[idx]);
        record.mergeHeight = tree.mergeHeight(members);
        result.groups.push_back(std::move(record));
        representatives.push_back(group.front());
    }

    result.matrix = scored.selectColumns(representatives);

    if (options.verbose) {
        std::cout << "[DepInfer][Reduce] " << p << " proteins -> " << representatives.size()
                  << " representatives at cosine cutoff " << options.cutoff
                  << " (Ward tree cut gives " << result.wardClusterCount << " clusters)\n";
    }
    return result;
}
