#include "NamedMatrix.h"
#include "DepInferExceptions.h"
#include <cmath>
#include <unordered_set>
#include <utility>

namespace {
std::vector<std::string> pick(const std::vector<std::string>& names, const std::vector<size_t>& indices) {
    std::vector<std::string> out;
    out.reserve(indices.size());
    for (size_t idx : indices) out.push_back(names.at(idx));
    return out;
}

void requireUnique(const std::vector<std::string>& names, const std::string& label, const char* axis) {
    std::unordered_set<std::string> seen;
    for (const auto& name : names) {
        if (!seen.insert(name).second) {
            throw DepInfer::ValidationException(label + ": duplicate " + axis + " name '" + name + "'");
        }
    }
}
} // namespace

NamedMatrix::NamedMatrix(std::vector<std::string> rows, std::vector<std::string> cols)
    : rowNames(std::move(rows)), colNames(std::move(cols)), values(rowNames.size(), colNames.size()) {}

NamedMatrix::NamedMatrix(std::vector<std::string> rows, std::vector<std::string> cols, MathUtils::Matrix v)
    : rowNames(std::move(rows)), colNames(std::move(cols)), values(std::move(v)) {}

std::optional<size_t> NamedMatrix::columnIndex(const std::string& name) const {
    for (size_t i = 0; i < colNames.size(); ++i) {
        if (colNames[i] == name) return i;
    }
    return std::nullopt;
}

std::optional<size_t> NamedMatrix::rowIndex(const std::string& name) const {
    for (size_t i = 0; i < rowNames.size(); ++i) {
        if (rowNames[i] == name) return i;
    }
    return std::nullopt;
}

NamedMatrix NamedMatrix::selectColumns(const std::vector<size_t>& indices) const {
    return NamedMatrix(rowNames, pick(colNames, indices), values.selectColumns(indices));
}

NamedMatrix NamedMatrix::selectRows(const std::vector<size_t>& indices) const {
    return NamedMatrix(pick(rowNames, indices), colNames, values.selectRows(indices));
}

bool NamedMatrix::hasMissing() const {
    for (const auto& row : values.data) {
        for (double v : row) {
            if (std::isnan(v)) return true;
        }
    }
    return false;
}

void NamedMatrix::validateShape(const std::string& label) const {
    if (values.rows == 0 || values.cols == 0) {
        throw DepInfer::ValidationException(label + " must have at least one row and one column");
    }
    if (values.data.size() != values.rows) {
        throw DepInfer::ValidationException(label + ": row storage does not match declared row count");
    }
    for (const auto& row : values.data) {
        if (row.size() != values.cols) {
            throw DepInfer::ValidationException(label + " is not rectangular");
        }
    }
    if (rowNames.size() != values.rows) {
        throw DepInfer::ValidationException(label + ": " + std::to_string(rowNames.size()) +
                                            " row names for " + std::to_string(values.rows) + " rows");
    }
    if (colNames.size() != values.cols) {
        throw DepInfer::ValidationException(label + ": " + std::to_string(colNames.size()) +
                                            " column names for " + std::to_string(values.cols) + " columns");
    }
    requireUnique(rowNames, label, "row");
    requireUnique(colNames, label, "column");
}
