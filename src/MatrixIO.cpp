#include "MatrixIO.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "DepInferExceptions.h"
#include <fstream>
#include <limits>
#include <unordered_set>

namespace MatrixIO {

NamedMatrix readNamedMatrix(const std::string& path, char delimiter) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw DepInfer::IOException("Could not open file: " + path);
    return readNamedMatrix(in, delimiter, path);
}

NamedMatrix readNamedMatrix(std::istream& in, char delimiter, const std::string& sourceLabel) {
    CSVUtils::skipBOM(in);
    size_t lineCounter = 0;
    CSVUtils::Record record;

    auto fail = [&](size_t line, const std::string& what) -> DepInfer::IOException {
        return DepInfer::IOException(sourceLabel + ":" + std::to_string(line) + ": " + what);
    };
    auto checkRecord = [&]() {
        if (record.limitExceeded) throw fail(record.firstLine, "record exceeds parser limits");
        if (record.malformed) throw fail(record.firstLine, "unterminated quoted field");
    };

    if (!CSVUtils::readRecord(in, delimiter, record, lineCounter)) {
        throw DepInfer::IOException(sourceLabel + ": file is empty");
    }
    checkRecord();
    if (record.fields.size() < 2) {
        throw fail(record.firstLine, "header needs a row-name cell and at least one column name");
    }

    std::vector<std::string> colNames(record.fields.begin() + 1, record.fields.end());
    std::unordered_set<std::string> seenCols;
    for (const auto& name : colNames) {
        if (name.empty()) throw fail(record.firstLine, "empty column name");
        if (!seenCols.insert(name).second) throw fail(record.firstLine, "duplicate column name '" + name + "'");
    }

    std::vector<std::string> rowNames;
    std::vector<std::vector<double>> rows;
    std::unordered_set<std::string> seenRows;
    while (CSVUtils::readRecord(in, delimiter, record, lineCounter)) {
        checkRecord();
        if (record.fields.size() != colNames.size() + 1) {
            throw fail(record.firstLine, "expected " + std::to_string(colNames.size() + 1) +
                                         " fields, found " + std::to_string(record.fields.size()));
        }
        const std::string& rowName = record.fields.front();
        if (rowName.empty()) throw fail(record.firstLine, "empty row name");
        if (!seenRows.insert(rowName).second) throw fail(record.firstLine, "duplicate row name '" + rowName + "'");

        std::vector<double> values;
        values.reserve(colNames.size());
        for (size_t c = 1; c < record.fields.size(); ++c) {
            const std::string& cell = record.fields[c];
            if (CommonUtils::isMissingToken(cell)) {
                values.push_back(std::numeric_limits<double>::quiet_NaN());
                continue;
            }
            bool ok = false;
            const double v = CSVUtils::parseNumber(cell, ok);
            if (!ok) {
                throw fail(record.firstLine, "non-numeric value '" + cell + "' in column '" + colNames[c - 1] + "'");
            }
            values.push_back(v);
        }
        rowNames.push_back(rowName);
        rows.push_back(std::move(values));
    }
    if (rows.empty()) {
        throw DepInfer::IOException(sourceLabel + ": no data rows");
    }

    MathUtils::Matrix values(rows.size(), colNames.size());
    values.data = std::move(rows);
    return NamedMatrix(std::move(rowNames), std::move(colNames), std::move(values));
}

NamedMatrix alignRows(const NamedMatrix& x, const NamedMatrix& y) {
    if (x.rowCount() != y.rowCount()) {
        throw DepInfer::ValidationException("Affinity matrix has " + std::to_string(x.rowCount()) +
                                            " drugs but response matrix has " + std::to_string(y.rowCount()));
    }
    std::vector<size_t> order;
    order.reserve(x.rowCount());
    for (const auto& drug : x.rowNames) {
        const auto idx = y.rowIndex(drug);
        if (!idx) {
            throw DepInfer::ValidationException("drug '" + drug + "' is missing from the response matrix");
        }
        order.push_back(*idx);
    }
    return y.selectRows(order);
}

} // namespace MatrixIO
