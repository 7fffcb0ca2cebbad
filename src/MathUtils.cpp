#include "MathUtils.h"
#include <cmath>
#include <numeric>
#include <stdexcept>
#ifdef USE_OPENMP
#include <omp.h>
#endif

MathUtils::Matrix MathUtils::Matrix::transpose() const {
    Matrix result(cols, rows);
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            result.at(c, r) = at(r, c);
        }
    }
    return result;
}

MathUtils::Matrix MathUtils::Matrix::multiply(const Matrix& other) const {
    if (cols != other.rows) throw std::invalid_argument("Matrix dimensions mismatch for multiplication.");
    Matrix result(rows, other.cols);
    Matrix otherT = other.transpose();

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (size_t r = 0; r < rows; ++r) {
        const auto& leftRow = data[r];
        auto& outRow = result.data[r];
        for (size_t c = 0; c < other.cols; ++c) {
            const auto& rightRow = otherT.data[c];
            double sum = 0.0;
            for (size_t k = 0; k < cols; ++k) {
                sum += leftRow[k] * rightRow[k];
            }
            outRow[c] = sum;
        }
    }
    return result;
}

MathUtils::Matrix MathUtils::Matrix::selectRows(const std::vector<size_t>& indices) const {
    Matrix out(indices.size(), cols);
    for (size_t i = 0; i < indices.size(); ++i) {
        out.data[i] = data.at(indices[i]);
    }
    return out;
}

MathUtils::Matrix MathUtils::Matrix::selectColumns(const std::vector<size_t>& indices) const {
    Matrix out(rows, indices.size());
    for (size_t r = 0; r < rows; ++r) {
        const auto& src = data[r];
        auto& dst = out.data[r];
        for (size_t j = 0; j < indices.size(); ++j) dst[j] = src.at(indices[j]);
    }
    return out;
}

std::vector<double> MathUtils::columnSums(const Matrix& m) {
    std::vector<double> sums(m.cols, 0.0);
    for (const auto& row : m.data) {
        for (size_t j = 0; j < m.cols; ++j) sums[j] += row[j];
    }
    return sums;
}

double MathUtils::dot(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) throw std::invalid_argument("Vector length mismatch for dot product.");
    return std::inner_product(a.begin(), a.end(), b.begin(), 0.0);
}

double MathUtils::norm2(const std::vector<double>& v) {
    return std::sqrt(dot(v, v));
}

MathUtils::Matrix MathUtils::cosineSimilarity(const Matrix& m) {
    const size_t p = m.cols;
    const Matrix cols = m.transpose();
    std::vector<double> norms(p, 0.0);
    for (size_t j = 0; j < p; ++j) norms[j] = norm2(cols.data[j]);

    Matrix sim(p, p);
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t i = 0; i < p; ++i) {
        sim.data[i][i] = 1.0;
        for (size_t j = i + 1; j < p; ++j) {
            const double denom = norms[i] * norms[j];
            double s = 0.0;
            if (denom > 0.0) {
                s = dot(cols.data[i], cols.data[j]) / denom;
                // Rounding can push identical columns just past 1.
                if (s > 1.0) s = 1.0;
                if (s < -1.0) s = -1.0;
            }
            sim.data[i][j] = s;
            sim.data[j][i] = s;
        }
    }
    return sim;
}

bool MathUtils::allFinite(const Matrix& m) {
    for (const auto& row : m.data) {
        for (double v : row) {
            if (!std::isfinite(v)) return false;
        }
    }
    return true;
}
