#include "CSVUtils.h"

#include <cstdio>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;

    const std::streampos origin = is.tellg();
    for (unsigned char expected : kBom) {
        const int c = is.get();
        if (c == EOF || static_cast<unsigned char>(c) != expected) {
            is.clear();
            is.seekg(origin);
            return;
        }
    }
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed,
                                      bool* limitExceeded,
                                      const ParseLimits& limits) {
    if (malformed) *malformed = false;
    if (limitExceeded) *limitExceeded = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawDelimiter = false;
    size_t recordBytes = 0;

    auto overLimit = [&]() {
        const bool over = (limits.maxFieldBytes > 0 && field.size() > limits.maxFieldBytes) ||
                          (limits.maxRecordBytes > 0 && recordBytes > limits.maxRecordBytes);
        if (over && limitExceeded) *limitExceeded = true;
        return over;
    };

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? field : trimUnquotedField(field));
        field.clear();
        fieldQuoted = false;
    };

    char c;
    while (is.get(c)) {
        ++recordBytes;

        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    ++recordBytes;
                    field.push_back('"');
                } else {
                    inQuotes = false;
                }
            } else if (c == '\r' && is.peek() == '\n') {
                is.get();
                ++recordBytes;
                field.push_back('\n');
            } else {
                field.push_back(c);
            }
        } else if (c == '"' && trimUnquotedField(field).empty() && !fieldQuoted) {
            field.clear();
            inQuotes = true;
            fieldQuoted = true;
        } else if (c == delimiter) {
            pushField();
            sawDelimiter = true;
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else {
            field.push_back(c);
        }

        if (overLimit()) return row;
    }

    if (inQuotes && malformed) *malformed = true;

    if (!sawDelimiter && !fieldQuoted && trimUnquotedField(field).empty()) {
        return {};
    }
    pushField();
    return row;
}
} // namespace CSVUtils
