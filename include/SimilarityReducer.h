#pragma once
#include "MathUtils.h"
#include "NamedMatrix.h"
#include <cstddef>
#include <string>
#include <vector>

// Proteins judged redundant with one representative; members[0] is the representative.
struct SimilarityGroup {
    std::string representative;
    std::vector<std::string> members;
    double mergeHeight = 0.0; // Ward height joining all members; 0 for singletons
};

struct ReductionOptions {
    // Treat input as dissociation constants: -log10, fill missing, arctan squash.
    bool transform = true;
    // Collapse proteins whose cosine similarity to a representative reaches `cutoff`.
    bool dedupe = true;
    // Proteins that always stay as their own column, in priority order.
    std::vector<std::string> keep;
    double cutoff = 0.8;
    bool verbose = false;
};

struct ReductionResult {
    NamedMatrix matrix;
    std::vector<SimilarityGroup> groups;
    // Clusters obtained by cutting the Ward tree at 1 - cutoff (diagnostic only).
    size_t wardClusterCount = 0;
};

class SimilarityReducer {
public:
    static constexpr double kMissingAffinity = -10.0;

    /**
     * @brief Transforms and/or deduplicates the protein axis of an affinity matrix.
     * @pre affinity rows are drugs and columns are proteins.
     * @post Column count never grows; every `keep` protein remains a column.
     * @throws DepInfer::ValidationException on invalid input or options.
     * @throws DepInfer::DegenerateClusterException when several proteins collapse into one column.
     */
    static ReductionResult reduce(const NamedMatrix& affinity, const ReductionOptions& options = {});

    /**
     * @brief Applies -log10, missing-value fill and the arctan squash to every entry.
     * @post Every entry lies strictly within (0,1).
     */
    static NamedMatrix transformAffinity(const NamedMatrix& affinity);

    // (atan((x + 2) * 3) + pi/2) / pi
    static double squashAffinity(double pAffinity);

    /**
     * @brief Column indices by descending column sum (stable), `keep` proteins first.
     */
    static std::vector<size_t> priorityOrder(const NamedMatrix& affinity, const std::vector<std::string>& keep);

    /**
     * @brief Greedy grouping over the priority order.
     * Each unassigned column becomes a representative and absorbs every unassigned,
     * unprotected column with similarity >= cutoff to it.
     * @post Groups appear in priority order; each group's first index is its representative.
     */
    static std::vector<std::vector<size_t>> groupByPriority(const MathUtils::Matrix& similarity,
                                                            const std::vector<size_t>& priority,
                                                            const std::vector<bool>& protectedColumns,
                                                            double cutoff);
};
