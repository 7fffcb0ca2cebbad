#pragma once
#include <cstddef>
#include <vector>

class MathUtils {
public:
    // Dense row-major matrix used by every numeric routine in the pipeline.
    struct Matrix {
        size_t rows = 0;
        size_t cols = 0;
        std::vector<std::vector<double>> data;

        Matrix() = default;
        Matrix(size_t r, size_t c, double fill = 0.0) : rows(r), cols(c), data(r, std::vector<double>(c, fill)) {}

        double& at(size_t r, size_t c) { return data[r][c]; }
        double at(size_t r, size_t c) const { return data[r][c]; }

        Matrix transpose() const;

        /**
         * @brief Matrix multiplication this * other.
         * @throws std::invalid_argument on shape mismatch.
         */
        Matrix multiply(const Matrix& other) const;

        /**
         * @brief Copies the listed rows (in the given order).
         * @pre every index < rows.
         */
        Matrix selectRows(const std::vector<size_t>& indices) const;

        /**
         * @brief Copies the listed columns (in the given order).
         * @pre every index < cols.
         */
        Matrix selectColumns(const std::vector<size_t>& indices) const;
    };

    static std::vector<double> columnSums(const Matrix& m);

    /**
     * @brief Pairwise cosine similarity between the columns of m.
     * @post Result is cols x cols, symmetric, with unit diagonal.
     *       A zero-norm column has similarity 0 to every other column.
     */
    static Matrix cosineSimilarity(const Matrix& m);

    static double dot(const std::vector<double>& a, const std::vector<double>& b);
    static double norm2(const std::vector<double>& v);

    // False when any entry is NaN or infinite.
    static bool allFinite(const Matrix& m);
};
