#include "TextAcquisition.h"

#include "CSVUtils.h"
#include "CommonUtils.h"
#include "JsonUtils.h"
#include "VeilExceptions.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace TextAcquisition {

SourceFormat formatForPath(const std::string& path) {
    const std::string ext = CommonUtils::toLower(std::filesystem::path(path).extension().string());
    if (ext == ".csv" || ext == ".tsv") return SourceFormat::DELIMITED;
    if (ext == ".json") return SourceFormat::JSON;
    return SourceFormat::PLAIN_TEXT;
}

std::string readFile(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw Veil::AcquisitionException("Failed to read file: " + path + " is a directory");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw Veil::AcquisitionException("Failed to read file: " + path);

    CSVUtils::skipBOM(in);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) throw Veil::AcquisitionException("Failed to read file: " + path);
    return buffer.str();
}

std::string flattenDelimited(const std::string& content, char delimiter) {
    std::istringstream in(content);
    std::string out;
    out.reserve(content.size());

    bool first = true;
    size_t record = 0;
    while (in.peek() != EOF) {
        ++record;
        bool malformed = false;
        bool limitExceeded = false;
        const std::vector<std::string> fields = CSVUtils::parseCSVLine(in, delimiter, &malformed, &limitExceeded);
        if (limitExceeded) {
            throw Veil::AcquisitionException("Delimited record exceeds parser limits");
        }
        if (malformed) {
            throw Veil::AcquisitionException("Malformed delimited record " + std::to_string(record) +
                                             ": unterminated quoted field");
        }

        if (!first) out.push_back('\n');
        first = false;
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) out.push_back(' ');
            out += fields[i];
        }
    }
    if (!content.empty() && content.back() == '\n') out.push_back('\n');
    return out;
}

std::string prettyPrintJson(const std::string& content) {
    try {
        return JsonUtils::parse(content).pretty(2);
    } catch (const Veil::ParseException& e) {
        throw Veil::AcquisitionException(std::string("Invalid JSON file: ") + e.what());
    }
}

std::string normalize(const std::string& content, SourceFormat format, const AcquisitionOptions& options) {
    switch (format) {
        case SourceFormat::DELIMITED: return flattenDelimited(content, options.delimiter);
        case SourceFormat::JSON: return prettyPrintJson(content);
        case SourceFormat::PLAIN_TEXT: return content;
    }
    return content;
}

AcquiredText acquireText(const std::string& path, const AcquisitionOptions& options) {
    AcquiredText acquired;
    acquired.format = formatForPath(path);

    AcquisitionOptions effective = options;
    if (CommonUtils::toLower(std::filesystem::path(path).extension().string()) == ".tsv") {
        effective.delimiter = '\t';
    }
    acquired.text = normalize(readFile(path), acquired.format, effective);
    return acquired;
}

} // namespace TextAcquisition
