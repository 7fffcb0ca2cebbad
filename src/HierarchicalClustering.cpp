#include "HierarchicalClustering.h"
#include "DepInferExceptions.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace {
constexpr double kSymmetryTolerance = 1e-9;

struct DisjointSet {
    std::vector<size_t> parent;

    explicit DisjointSet(size_t n) : parent(n) {
        std::iota(parent.begin(), parent.end(), 0);
    }

    size_t find(size_t x) {
        while (parent[x] != x) {
            parent[x] = parent[parent[x]];
            x = parent[x];
        }
        return x;
    }

    void unite(size_t a, size_t b) {
        a = find(a);
        b = find(b);
        if (a != b) parent[std::max(a, b)] = std::min(a, b);
    }
};

// Representative leaf of a dendrogram node, used to replay merges on leaves.
size_t firstLeaf(const Dendrogram& tree, size_t node) {
    while (node >= tree.leafCount) {
        node = tree.merges[node - tree.leafCount].left;
    }
    return node;
}
} // namespace

std::vector<size_t> Dendrogram::leafOrder() const {
    std::vector<size_t> order;
    order.reserve(leafCount);
    if (leafCount == 0) return order;
    if (merges.empty()) {
        for (size_t i = 0; i < leafCount; ++i) order.push_back(i);
        return order;
    }

    std::vector<size_t> stack{leafCount + merges.size() - 1};
    while (!stack.empty()) {
        const size_t node = stack.back();
        stack.pop_back();
        if (node < leafCount) {
            order.push_back(node);
            continue;
        }
        const DendrogramMerge& m = merges[node - leafCount];
        stack.push_back(m.right);
        stack.push_back(m.left);
    }
    return order;
}

double Dendrogram::mergeHeight(const std::vector<size_t>& leaves) const {
    if (leaves.size() < 2) return 0.0;
    DisjointSet sets(leafCount);
    auto joined = [&]() {
        const size_t root = sets.find(leaves.front());
        for (size_t leaf : leaves) {
            if (sets.find(leaf) != root) return false;
        }
        return true;
    };
    if (joined()) return 0.0;

    for (const auto& m : merges) {
        sets.unite(firstLeaf(*this, m.left), firstLeaf(*this, m.right));
        if (joined()) return m.height;
    }
    return std::numeric_limits<double>::infinity();
}

std::vector<size_t> Dendrogram::cut(double height) const {
    DisjointSet sets(leafCount);
    for (const auto& m : merges) {
        if (m.height > height) continue;
        sets.unite(firstLeaf(*this, m.left), firstLeaf(*this, m.right));
    }

    std::vector<size_t> labels(leafCount, 0);
    std::vector<size_t> labelOfRoot(leafCount, std::numeric_limits<size_t>::max());
    size_t next = 0;
    for (size_t i = 0; i < leafCount; ++i) {
        const size_t root = sets.find(i);
        if (labelOfRoot[root] == std::numeric_limits<size_t>::max()) labelOfRoot[root] = next++;
        labels[i] = labelOfRoot[root];
    }
    return labels;
}

namespace HierarchicalClustering {

Dendrogram wardLinkage(const MathUtils::Matrix& distances) {
    if (distances.rows != distances.cols) {
        throw DepInfer::ValidationException("Ward linkage requires a square distance matrix");
    }
    const size_t n = distances.rows;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            const double d = distances.at(i, j);
            if (!std::isfinite(d) || d < 0.0) {
                throw DepInfer::ValidationException("Ward linkage requires finite non-negative distances");
            }
            if (std::abs(d - distances.at(j, i)) > kSymmetryTolerance) {
                throw DepInfer::ValidationException("Ward linkage requires a symmetric distance matrix");
            }
        }
    }

    Dendrogram tree;
    tree.leafCount = n;
    if (n < 2) return tree;
    tree.merges.reserve(n - 1);

    // Squared dissimilarities between active clusters, indexed by slot.
    MathUtils::Matrix d2(n, n);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) d2.at(i, j) = distances.at(i, j) * distances.at(i, j);
    }
    std::vector<size_t> nodeOfSlot(n);
    std::iota(nodeOfSlot.begin(), nodeOfSlot.end(), 0);
    std::vector<size_t> sizeOfSlot(n, 1);
    std::vector<bool> active(n, true);

    for (size_t step = 0; step + 1 < n; ++step) {
        size_t bi = 0;
        size_t bj = 0;
        double best = std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < n; ++i) {
            if (!active[i]) continue;
            for (size_t j = i + 1; j < n; ++j) {
                if (!active[j]) continue;
                if (d2.at(i, j) < best) {
                    best = d2.at(i, j);
                    bi = i;
                    bj = j;
                }
            }
        }

        const double ni = static_cast<double>(sizeOfSlot[bi]);
        const double nj = static_cast<double>(sizeOfSlot[bj]);
        for (size_t k = 0; k < n; ++k) {
            if (!active[k] || k == bi || k == bj) continue;
            const double nk = static_cast<double>(sizeOfSlot[k]);
            const double updated = ((ni + nk) * d2.at(k, bi) + (nj + nk) * d2.at(k, bj) - nk * best) / (ni + nj + nk);
            d2.at(k, bi) = std::max(0.0, updated);
            d2.at(bi, k) = d2.at(k, bi);
        }

        DendrogramMerge merge;
        merge.left = std::min(nodeOfSlot[bi], nodeOfSlot[bj]);
        merge.right = std::max(nodeOfSlot[bi], nodeOfSlot[bj]);
        merge.height = std::sqrt(best);
        merge.size = sizeOfSlot[bi] + sizeOfSlot[bj];
        tree.merges.push_back(merge);

        nodeOfSlot[bi] = n + step;
        sizeOfSlot[bi] = merge.size;
        active[bj] = false;
    }
    return tree;
}

} // namespace HierarchicalClustering
