#include "isolation_forest.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "obs/metrics.h"

namespace logrca::anomaly {

namespace {

constexpr double kEulerGamma = 0.5772156649015329;

struct WorkItem {
    size_t node;
    std::vector<size_t> rows;
    size_t depth;
};

} // namespace

auto AveragePathLength(size_t n) -> double {
    if (n <= 1) { return 0.0; }
    if (n == 2) { return 1.0; }
    double nd = static_cast<double>(n);
    double harmonic = std::log(nd - 1.0) + kEulerGamma;
    return 2.0 * harmonic - 2.0 * (nd - 1.0) / nd;
}

auto IsolationTree::Build(const linalg::Matrix& x,
                          std::vector<size_t> rows,
                          size_t max_depth,
                          std::mt19937_64& rng) -> IsolationTree {
    IsolationTree tree;
    tree.nodes_.emplace_back();

    std::vector<WorkItem> work;
    work.push_back({0, std::move(rows), 0});

    std::vector<size_t> candidates;
    std::vector<double> lo(x.cols);
    std::vector<double> hi(x.cols);

    while (!work.empty()) {
        WorkItem item = std::move(work.back());
        work.pop_back();

        tree.nodes_[item.node].depth = item.depth;
        tree.nodes_[item.node].size = item.rows.size();

        if (item.rows.size() <= 1 || item.depth >= max_depth) {
            continue;
        }

        std::fill(lo.begin(), lo.end(), std::numeric_limits<double>::infinity());
        std::fill(hi.begin(), hi.end(), -std::numeric_limits<double>::infinity());
        for (size_t r : item.rows) {
            const double* row = x.Row(r);
            for (size_t c = 0; c < x.cols; ++c) {
                lo[c] = std::min(lo[c], row[c]);
                hi[c] = std::max(hi[c], row[c]);
            }
        }

        candidates.clear();
        for (size_t c = 0; c < x.cols; ++c) {
            if (hi[c] > lo[c]) {
                candidates.push_back(c);
            }
        }
        // All rows identical: nothing left to isolate.
        if (candidates.empty()) {
            continue;
        }

        std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
        size_t feature = candidates[pick(rng)];
        std::uniform_real_distribution<double> split_dist(lo[feature], hi[feature]);
        double split = split_dist(rng);

        std::vector<size_t> left_rows;
        std::vector<size_t> right_rows;
        for (size_t r : item.rows) {
            if (x(r, feature) < split) {
                left_rows.push_back(r);
            } else {
                right_rows.push_back(r);
            }
        }

        auto left = tree.nodes_.size();
        tree.nodes_.emplace_back();
        auto right = tree.nodes_.size();
        tree.nodes_.emplace_back();

        auto& node = tree.nodes_[item.node];
        node.feature = static_cast<int>(feature);
        node.split = split;
        node.left = static_cast<int>(left);
        node.right = static_cast<int>(right);

        work.push_back({right, std::move(right_rows), item.depth + 1});
        work.push_back({left, std::move(left_rows), item.depth + 1});
    }

    return tree;
}

auto IsolationTree::PathLength(const double* row) const -> double {
    size_t idx = 0;
    size_t edges = 0;
    while (!nodes_[idx].IsLeaf()) {
        const auto& node = nodes_[idx];
        idx = static_cast<size_t>(row[node.feature] < node.split ? node.left : node.right);
        ++edges;
    }
    return static_cast<double>(edges) + AveragePathLength(nodes_[idx].size);
}

auto IsolationTree::MaxDepth() const -> size_t {
    size_t depth = 0;
    for (const auto& n : nodes_) {
        depth = std::max(depth, n.depth);
    }
    return depth;
}

auto IsolationForest::TreeRng(uint64_t seed, size_t tree_index) -> std::mt19937_64 {
    std::seed_seq seq{static_cast<uint32_t>(seed & 0xffffffffULL),
                      static_cast<uint32_t>(seed >> 32),
                      static_cast<uint32_t>(tree_index)};
    return std::mt19937_64(seq);
}

auto IsolationForest::BuildTree(const linalg::Matrix& x, size_t tree_index, size_t max_depth) const -> IsolationTree {
    auto rng = TreeRng(config_.seed, tree_index);

    std::vector<size_t> rows(x.rows);
    for (size_t i = 0; i < rows.size(); ++i) {
        rows[i] = i;
    }
    // Partial Fisher-Yates: the first sample_size_ entries are the subsample.
    if (sample_size_ < x.rows) {
        for (size_t i = 0; i < sample_size_; ++i) {
            std::uniform_int_distribution<size_t> dist(i, rows.size() - 1);
            std::swap(rows[i], rows[dist(rng)]);
        }
        rows.resize(sample_size_);
    }
    return IsolationTree::Build(x, std::move(rows), max_depth, rng);
}

auto IsolationForest::Fit(const linalg::Matrix& x) -> void {
    if (x.rows == 0 || x.cols == 0) {
        throw std::invalid_argument("IsolationForest::Fit requires a non-empty matrix");
    }
    if (config_.n_trees <= 0) {
        throw std::invalid_argument("n_trees must be positive");
    }

    sample_size_ = std::min(std::max<size_t>(config_.max_samples, 1), x.rows);
    auto max_depth = static_cast<size_t>(std::ceil(std::log2(std::max<double>(static_cast<double>(sample_size_), 2.0))));
    auto n_trees = static_cast<size_t>(config_.n_trees);

    trees_.clear();
    trees_.resize(n_trees);

    auto n_threads = static_cast<size_t>(std::max(1, config_.n_threads));
    n_threads = std::min(n_threads, n_trees);

    auto start = std::chrono::steady_clock::now();
    if (n_threads == 1) {
        for (size_t t = 0; t < n_trees; ++t) {
            trees_[t] = BuildTree(x, t, max_depth);
        }
    } else {
        // Trees are independent; worker w owns slots w, w + n, w + 2n, ...
        std::vector<std::thread> workers;
        std::vector<std::exception_ptr> errors(n_threads);
        workers.reserve(n_threads);
        for (size_t w = 0; w < n_threads; ++w) {
            workers.emplace_back([this, &x, &errors, w, n_threads, n_trees, max_depth]() {
                try {
                    for (size_t t = w; t < n_trees; t += n_threads) {
                        trees_[t] = BuildTree(x, t, max_depth);
                    }
                } catch (...) {
                    errors[w] = std::current_exception();
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        for (const auto& err : errors) {
            if (err) {
                trees_.clear();
                std::rethrow_exception(err);
            }
        }
    }
    double duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    spdlog::debug("IsolationForest fitted: trees={}, sample_size={}, max_depth={}, threads={}, duration_ms={:.2f}",
                  n_trees, sample_size_, max_depth, n_threads, duration_ms);
    obs::EmitHistogram("forest_fit_duration_ms", duration_ms, "ms", "detector");
}

auto IsolationForest::MeanPathLength(const double* row) const -> double {
    if (trees_.empty()) {
        throw std::logic_error("IsolationForest used before Fit");
    }
    double total = 0.0;
    for (const auto& tree : trees_) {
        total += tree.PathLength(row);
    }
    return total / static_cast<double>(trees_.size());
}

auto IsolationForest::Score(const double* row) const -> double {
    double norm = AveragePathLength(sample_size_);
    if (norm <= 0.0) {
        norm = 1.0;
    }
    return std::pow(2.0, -MeanPathLength(row) / norm);
}

auto IsolationForest::ScoreAll(const linalg::Matrix& x) const -> std::vector<double> {
    std::vector<double> scores(x.rows, 0.0);
    for (size_t r = 0; r < x.rows; ++r) {
        scores[r] = Score(x.Row(r));
    }
    return scores;
}

} // namespace logrca::anomaly
