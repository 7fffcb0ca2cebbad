#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Record tokenization for delimited matrix files. Quoted fields may span lines.
struct ParseLimits {
    size_t maxFieldBytes = 1024 * 1024;      // 1 MiB
    size_t maxColumns = 200000;
};

struct Record {
    std::vector<std::string> fields;
    size_t firstLine = 0; // 1-based physical line where the record starts
    bool malformed = false;
    bool limitExceeded = false;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one record; returns false at end of input.
 * Blank lines are skipped and do not produce records.
 */
bool readRecord(std::istream& is,
                char delimiter,
                Record& record,
                size_t& lineCounter,
                const ParseLimits& limits = ParseLimits{});

// Parses a whole-cell decimal number; `ok` is false for text, partial numbers and empty cells.
double parseNumber(const std::string& cell, bool& ok);
} // namespace CSVUtils
