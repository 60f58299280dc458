#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace JsonUtils {

// Deepest array/object nesting parse() accepts.
constexpr size_t kMaxNestingDepth = 512;

struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };

    Type type = Type::Null;
    bool booleanValue = false;
    double numberValue = 0.0;
    std::string numberText;  // lexeme as written, reused on output
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::vector<std::pair<std::string, JsonValue>> objectValue;  // document order

    bool isObject() const noexcept { return type == Type::Object; }
    bool isArray() const noexcept { return type == Type::Array; }
    bool isString() const noexcept { return type == Type::String; }
    bool isNumber() const noexcept { return type == Type::Number; }

    const JsonValue* find(const std::string& key) const;

    std::string dump() const;

    // Multi-line rendering, `indent` spaces per level, no trailing newline.
    std::string pretty(int indent = 2) const;
};

/**
 * @brief Parses a complete JSON document.
 * Unpaired UTF-16 surrogate escapes decode to U+FFFD.
 * @throws Veil::ParseException on malformed input, trailing content or
 * nesting deeper than kMaxNestingDepth.
 */
JsonValue parse(const std::string& text);

std::string escapeJsonString(const std::string& value);

} // namespace JsonUtils
