#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "../detector_config.h"
#include "linalg/matrix.h"

namespace logrca::anomaly {

// Expected path length of an unsuccessful BST search over n points:
// c(n) = 2H(n-1) - 2(n-1)/n, c(2) = 1, c(n <= 1) = 0.
auto AveragePathLength(size_t n) -> double;

class IsolationTree {
public:
    struct Node {
        int feature = -1; // -1 marks a leaf
        double split = 0.0;
        int left = -1;
        int right = -1;
        size_t size = 0; // rows held by a leaf
        size_t depth = 0;

        [[nodiscard]] auto IsLeaf() const -> bool { return feature < 0; }
    };

    // Grows a tree over `rows` of `x` using an explicit work-list.
    static auto Build(const linalg::Matrix& x,
                      std::vector<size_t> rows,
                      size_t max_depth,
                      std::mt19937_64& rng) -> IsolationTree;

    // Edges from root to the leaf plus c(leaf size).
    [[nodiscard]] auto PathLength(const double* row) const -> double;

    [[nodiscard]] auto Nodes() const -> const std::vector<Node>& { return nodes_; }
    [[nodiscard]] auto MaxDepth() const -> size_t;

private:
    std::vector<Node> nodes_;
};

class IsolationForest {
public:
    explicit IsolationForest(ForestConfig config) : config_(config) {}

    // Throws std::invalid_argument on an empty matrix or a non-positive tree count.
    auto Fit(const linalg::Matrix& x) -> void;

    [[nodiscard]] auto MeanPathLength(const double* row) const -> double;

    // 2^(-E[h(x)] / c(psi)) in (0, 1]; higher is more anomalous.
    [[nodiscard]] auto Score(const double* row) const -> double;
    [[nodiscard]] auto ScoreAll(const linalg::Matrix& x) const -> std::vector<double>;

    [[nodiscard]] auto IsFitted() const -> bool { return !trees_.empty(); }
    [[nodiscard]] auto SampleSize() const -> size_t { return sample_size_; }
    [[nodiscard]] auto Trees() const -> const std::vector<IsolationTree>& { return trees_; }

    // Generator for one tree, independent of how trees are spread over threads.
    static auto TreeRng(uint64_t seed, size_t tree_index) -> std::mt19937_64;

private:
    auto BuildTree(const linalg::Matrix& x, size_t tree_index, size_t max_depth) const -> IsolationTree;

    ForestConfig config_;
    size_t sample_size_ = 0;
    std::vector<IsolationTree> trees_;
};

} // namespace logrca::anomaly
