#include "linalg/matrix.h"

#include <cmath>
#include <stdexcept>

namespace logrca::linalg {

Matrix::Matrix(size_t r, size_t c) : rows(r), cols(c), data(r * c, 0.0) {}

auto Matrix::operator()(size_t r, size_t c) -> double& {
    return data[r * cols + c];
}

auto Matrix::operator()(size_t r, size_t c) const -> double {
    return data[r * cols + c];
}

auto column_means(const Matrix& m) -> Vector {
    Vector means(m.cols, 0.0);
    if (m.rows == 0) {
        return means;
    }
    for (size_t r = 0; r < m.rows; ++r) {
        for (size_t c = 0; c < m.cols; ++c) {
            means[c] += m(r, c);
        }
    }
    for (double& v : means) {
        v /= static_cast<double>(m.rows);
    }
    return means;
}

auto column_stddevs(const Matrix& m, const Vector& means) -> Vector {
    if (means.size() != m.cols) {
        throw std::runtime_error("column_stddevs dimension mismatch");
    }
    Vector out(m.cols, 0.0);
    if (m.rows == 0) {
        return out;
    }
    for (size_t r = 0; r < m.rows; ++r) {
        for (size_t c = 0; c < m.cols; ++c) {
            double d = m(r, c) - means[c];
            out[c] += d * d;
        }
    }
    for (double& v : out) {
        v = std::sqrt(v / static_cast<double>(m.rows));
    }
    return out;
}

} // namespace logrca::linalg
