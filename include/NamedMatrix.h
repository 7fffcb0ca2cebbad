#pragma once
#include "MathUtils.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Matrix with row and column identifiers. Drugs are rows; proteins or samples are columns.
struct NamedMatrix {
    std::vector<std::string> rowNames;
    std::vector<std::string> colNames;
    MathUtils::Matrix values;

    NamedMatrix() = default;
    NamedMatrix(std::vector<std::string> rows, std::vector<std::string> cols);
    NamedMatrix(std::vector<std::string> rows, std::vector<std::string> cols, MathUtils::Matrix v);

    size_t rowCount() const { return values.rows; }
    size_t colCount() const { return values.cols; }

    double& at(size_t r, size_t c) { return values.at(r, c); }
    double at(size_t r, size_t c) const { return values.at(r, c); }

    std::optional<size_t> columnIndex(const std::string& name) const;
    std::optional<size_t> rowIndex(const std::string& name) const;

    NamedMatrix selectColumns(const std::vector<size_t>& indices) const;
    NamedMatrix selectRows(const std::vector<size_t>& indices) const;

    bool hasMissing() const;

    /**
     * @brief Checks shape and naming consistency.
     * @throws DepInfer::ValidationException naming `label` when names and values disagree,
     *         the matrix is empty, or names repeat.
     */
    void validateShape(const std::string& label) const;
};
