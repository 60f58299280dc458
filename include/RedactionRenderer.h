#pragma once

#include "PiiEntity.h"

#include <string>
#include <vector>

namespace RedactionRenderer {

/**
 * @brief Replaces every entity span with one marker byte per byte of the span.
 * @pre entities are pairwise non-overlapping with offsets into text.
 * @post Result has exactly text.size() bytes. Entities whose span does not fit
 * in text are left unrendered.
 */
std::string redact(const std::string& text, const std::vector<PiiEntity>& entities, char marker);

/**
 * @brief Replaces every entity span with one copy of marker per UTF-8 code
 * point of the span. The code-point length of the text is preserved when
 * marker is a single code point; the byte length only when it is also a
 * single byte and the spans are ASCII.
 */
std::string redact(const std::string& text, const std::vector<PiiEntity>& entities, const std::string& marker);

} // namespace RedactionRenderer
