#include "CSVUtils.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    if (!is.good()) return;

    const int first = is.peek();
    if (first == EOF || static_cast<unsigned char>(first) != 0xEF) {
        return;
    }

    is.get();
    const int second = is.peek();
    if (second == EOF || static_cast<unsigned char>(second) != 0xBB) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        return;
    }

    is.get();
    const int third = is.peek();
    if (third == EOF || static_cast<unsigned char>(third) != 0xBF) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        is.unget();
        return;
    }

    is.get();
}

bool readRecord(std::istream& is,
                char delimiter,
                Record& record,
                size_t& lineCounter,
                const ParseLimits& limits) {
    while (true) {
        record = Record{};
        if (is.peek() == EOF) return false;
        record.firstLine = lineCounter + 1;

        std::string val;
        bool inQuotes = false;
        bool fieldQuoted = false;
        bool sawContent = false;
        bool ended = false;
        char c;

        auto pushField = [&]() {
            record.fields.push_back(fieldQuoted ? val : trimUnquotedField(val));
            val.clear();
            fieldQuoted = false;
            if (limits.maxColumns > 0 && record.fields.size() > limits.maxColumns) record.limitExceeded = true;
        };
        auto append = [&](char ch) {
            val += ch;
            if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) record.limitExceeded = true;
        };

        while (!record.limitExceeded && is.get(c)) {
            if (c == '"') {
                sawContent = true;
                if (!inQuotes && trimUnquotedField(val).empty() && !fieldQuoted) {
                    val.clear();
                    inQuotes = true;
                    fieldQuoted = true;
                } else if (inQuotes) {
                    if (is.peek() == '"') {
                        is.get();
                        append('"');
                    } else {
                        inQuotes = false;
                    }
                } else {
                    append(c);
                }
            } else if (c == delimiter && !inQuotes) {
                sawContent = true;
                pushField();
            } else if (c == '\r' || c == '\n') {
                if (c == '\r' && is.peek() == '\n') is.get();
                ++lineCounter;
                if (inQuotes) {
                    append('\n');
                } else {
                    ended = true;
                    break;
                }
            } else {
                if (c != ' ' && c != '\t') sawContent = true;
                append(c);
            }
        }
        if (!ended && !record.limitExceeded) ++lineCounter;

        if (inQuotes) record.malformed = true;
        if (!sawContent && !record.malformed && !record.limitExceeded) {
            if (is.peek() == EOF && !ended) return false;
            continue;
        }
        pushField();
        return true;
    }
}

double parseNumber(const std::string& cell, bool& ok) {
    ok = false;
    const std::string text = trimUnquotedField(cell);
    if (text.empty()) return 0.0;
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE) return 0.0;
    ok = true;
    return value;
}
} // namespace CSVUtils
