#pragma once

#include <string>

enum class SourceFormat { PLAIN_TEXT, DELIMITED, JSON };

struct AcquisitionOptions {
    char delimiter = ',';
};

struct AcquiredText {
    std::string text;
    SourceFormat format = SourceFormat::PLAIN_TEXT;
};

namespace TextAcquisition {

// By extension, case-insensitive: .csv/.tsv are delimited, .json is JSON,
// anything else is plain text.
SourceFormat formatForPath(const std::string& path);

/**
 * @brief Reads the whole file, dropping a leading UTF-8 BOM.
 * @throws Veil::AcquisitionException if the file cannot be read.
 */
std::string readFile(const std::string& path);

/**
 * @brief One line per record, fields joined by a single space.
 * @throws Veil::AcquisitionException on an unterminated quoted field.
 */
std::string flattenDelimited(const std::string& content, char delimiter);

/**
 * @brief Re-serialises a JSON document with two-space indentation.
 * @throws Veil::AcquisitionException on a parse failure.
 */
std::string prettyPrintJson(const std::string& content);

std::string normalize(const std::string& content, SourceFormat format, const AcquisitionOptions& options = {});

/**
 * @brief Produces the exact text every detection offset refers to.
 * @throws Veil::AcquisitionException on unreadable or malformed sources.
 */
AcquiredText acquireText(const std::string& path, const AcquisitionOptions& options = {});

} // namespace TextAcquisition
