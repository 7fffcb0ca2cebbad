#pragma once
#include "MathUtils.h"
#include <cstddef>
#include <vector>

// One agglomeration step. Node ids below leafCount are leaves; node leafCount + k is merge k.
struct DendrogramMerge {
    size_t left = 0;
    size_t right = 0;
    double height = 0.0;
    size_t size = 0;
};

struct Dendrogram {
    size_t leafCount = 0;
    std::vector<DendrogramMerge> merges;

    /**
     * @brief Leaves in left-to-right plotting order of the tree.
     */
    std::vector<size_t> leafOrder() const;

    /**
     * @brief Height of the lowest merge joining all the given leaves.
     * @post Returns 0 for fewer than two distinct leaves.
     */
    double mergeHeight(const std::vector<size_t>& leaves) const;

    /**
     * @brief Cuts the tree at `height`: merges with height <= height are applied.
     * @post Returns one cluster label per leaf; labels are numbered 0..k-1 by first leaf.
     */
    std::vector<size_t> cut(double height) const;
};

namespace HierarchicalClustering {

/**
 * @brief Agglomerative Ward clustering (ward.D2 criterion).
 * Squared dissimilarities are merged with the Lance-Williams Ward update and
 * heights are reported on the input dissimilarity scale.
 * Ties pick the lowest (i, j) cluster pair so results are deterministic.
 * @pre distances is square, symmetric, finite and non-negative.
 * @throws DepInfer::ValidationException when the preconditions fail.
 */
Dendrogram wardLinkage(const MathUtils::Matrix& distances);

} // namespace HierarchicalClustering
