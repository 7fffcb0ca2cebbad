#pragma once
#include "NamedMatrix.h"
#include <istream>
#include <string>

namespace MatrixIO {

/**
 * @brief Loads a delimited matrix: header row of column names (first cell ignored),
 *        then one row per record with the row name first.
 * Empty, NA, NaN and NULL cells become NaN.
 * @throws DepInfer::IOException when the file cannot be read or is malformed.
 */
NamedMatrix readNamedMatrix(const std::string& path, char delimiter = ',');
NamedMatrix readNamedMatrix(std::istream& in, char delimiter, const std::string& sourceLabel);

/**
 * @brief Reorders `y` rows to follow the row order of `x`.
 * @throws DepInfer::ValidationException when the two matrices do not list the same row names.
 */
NamedMatrix alignRows(const NamedMatrix& x, const NamedMatrix& y);

} // namespace MatrixIO
