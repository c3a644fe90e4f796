#pragma once

#include <cstddef>
#include <vector>

namespace logrca::linalg {

using Vector = std::vector<double>;

// Row-major dense matrix; one row per sample.
struct Matrix {
    size_t rows = 0;
    size_t cols = 0;
    std::vector<double> data;

    Matrix() = default;
    Matrix(size_t r, size_t c);

    auto operator()(size_t r, size_t c) -> double&;
    auto operator()(size_t r, size_t c) const -> double;

    [[nodiscard]] auto Row(size_t r) const -> const double* { return data.data() + r * cols; }
};

auto column_means(const Matrix& m) -> Vector;
// Population standard deviation (divides by n).
auto column_stddevs(const Matrix& m, const Vector& means) -> Vector;

} // namespace logrca::linalg
