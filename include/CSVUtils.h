#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Record tokenization for delimited text. Fields are kept as text; nothing is
// typed or validated beyond quoting.
struct ParseLimits {
	size_t maxFieldBytes = 8 * 1024 * 1024;           // 8 MiB
	size_t maxRecordBytes = 64 * 1024 * 1024;         // 64 MiB
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * Reads one record. Quoted fields may span physical lines and use "" for a
 * literal quote. Returns an empty vector for a blank line.
 * `malformed` is set when the stream ends inside a quoted field,
 * `limitExceeded` when a field or the record outgrows `limits`.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
									  char delimiter,
									  bool* malformed = nullptr,
									  bool* limitExceeded = nullptr,
									  const ParseLimits& limits = ParseLimits{});
}
