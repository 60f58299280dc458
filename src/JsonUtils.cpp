#include "JsonUtils.h"

#include "VeilExceptions.h"

#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace JsonUtils {
namespace {
class JsonParser {
public:
    explicit JsonParser(const std::string& source) : text(source) {}

    JsonValue parse() {
        skipWhitespace();
        JsonValue value = parseValue();
        skipWhitespace();
        if (position != text.size()) {
            fail("Unexpected trailing JSON content");
        }
        return value;
    }

private:
    const std::string& text;
    size_t position = 0;
    size_t depth = 0;

    static constexpr unsigned kReplacementCharacter = 0xFFFD;

    [[noreturn]] void fail(const std::string& message) const {
        throw Veil::ParseException(message + " at offset " + std::to_string(position));
    }

    void skipWhitespace() {
        while (position < text.size() && std::isspace(static_cast<unsigned char>(text[position])) != 0) {
            ++position;
        }
    }

    char peek() const {
        if (position >= text.size()) fail("Unexpected end of JSON input");
        return text[position];
    }

    char take() {
        if (position >= text.size()) fail("Unexpected end of JSON input");
        return text[position++];
    }

    void expect(char expected) {
        if (take() != expected) {
            --position;
            fail(std::string("Expected JSON character '") + expected + "'");
        }
    }

    void enterContainer() {
        if (++depth > kMaxNestingDepth) fail("JSON nesting too deep");
    }

    JsonValue parseValue() {
        skipWhitespace();
        const char c = peek();
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == '"') return parseString();
        if (c == 't' || c == 'f') return parseBoolean();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber();
        fail("Invalid JSON token");
    }

    JsonValue parseObject() {
        JsonValue object;
        object.type = JsonValue::Type::Object;

        expect('{');
        enterContainer();
        skipWhitespace();
        if (peek() == '}') {
            take();
            --depth;
            return object;
        }

        while (true) {
            skipWhitespace();
            if (peek() != '"') fail("Expected string key in JSON object");
            JsonValue key = parseString();
            skipWhitespace();
            expect(':');
            JsonValue value = parseValue();

            bool replaced = false;
            for (auto& member : object.objectValue) {
                if (member.first == key.stringValue) {
                    member.second = std::move(value);
                    replaced = true;
                    break;
                }
            }
            if (!replaced) object.objectValue.emplace_back(std::move(key.stringValue), std::move(value));

            skipWhitespace();
            const char next = take();
            if (next == '}') break;
            if (next != ',') fail("Expected ',' or '}' in JSON object");
        }
        --depth;
        return object;
    }

    JsonValue parseArray() {
        JsonValue array;
        array.type = JsonValue::Type::Array;

        expect('[');
        enterContainer();
        skipWhitespace();
        if (peek() == ']') {
            take();
            --depth;
            return array;
        }

        while (true) {
            array.arrayValue.push_back(parseValue());
            skipWhitespace();
            const char next = take();
            if (next == ']') break;
            if (next != ',') fail("Expected ',' or ']' in JSON array");
        }
        --depth;
        return array;
    }

    unsigned parseHex4() {
        unsigned value = 0;
        for (int i = 0; i < 4; ++i) {
            const char h = take();
            value <<= 4;
            if (h >= '0' && h <= '9') value |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') value |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') value |= static_cast<unsigned>(h - 'A' + 10);
            else fail("Invalid \\u escape in JSON string");
        }
        return value;
    }

    static void appendUtf8(std::string& out, unsigned cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    JsonValue parseString() {
        JsonValue str;
        str.type = JsonValue::Type::String;

        expect('"');
        while (true) {
            const char c = take();
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Unescaped control character in JSON string");
            if (c != '\\') {
                str.stringValue.push_back(c);
                continue;
            }

            const char escaped = take();
            switch (escaped) {
                case '"': str.stringValue.push_back('"'); break;
                case '\\': str.stringValue.push_back('\\'); break;
                case '/': str.stringValue.push_back('/'); break;
                case 'b': str.stringValue.push_back('\b'); break;
                case 'f': str.stringValue.push_back('\f'); break;
                case 'n': str.stringValue.push_back('\n'); break;
                case 'r': str.stringValue.push_back('\r'); break;
                case 't': str.stringValue.push_back('\t'); break;
                case 'u': {
                    unsigned cp = parseHex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        const size_t next = position;
                        unsigned low = 0;
                        if (text.compare(position, 2, "\\u") == 0) {
                            position += 2;
                            low = parseHex4();
                        }
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            // Unpaired; whatever follows is decoded on its own.
                            cp = kReplacementCharacter;
                            position = next;
                        }
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        cp = kReplacementCharacter;
                    }
                    appendUtf8(str.stringValue, cp);
                    break;
                }
                default:
                    fail("Unsupported escaped character in JSON string");
            }
        }
        return str;
    }

    JsonValue parseBoolean() {
        JsonValue value;
        value.type = JsonValue::Type::Bool;
        if (text.compare(position, 4, "true") == 0) {
            value.booleanValue = true;
            position += 4;
            return value;
        }
        if (text.compare(position, 5, "false") == 0) {
            position += 5;
            return value;
        }
        fail("Invalid JSON boolean value");
    }

    JsonValue parseNull() {
        if (text.compare(position, 4, "null") != 0) fail("Invalid JSON null value");
        position += 4;
        return JsonValue{};
    }

    void consumeDigits() {
        while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
            ++position;
        }
    }

    JsonValue parseNumber() {
        const size_t start = position;
        if (peek() == '-') take();

        if (position < text.size() && text[position] == '0') {
            ++position;
        } else {
            const size_t intStart = position;
            consumeDigits();
            if (position == intStart) fail("Invalid JSON number");
        }
        if (position < text.size() && text[position] == '.') {
            ++position;
            const size_t fracStart = position;
            consumeDigits();
            if (position == fracStart) fail("Invalid JSON number");
        }
        if (position < text.size() && (text[position] == 'e' || text[position] == 'E')) {
            ++position;
            if (position < text.size() && (text[position] == '+' || text[position] == '-')) ++position;
            const size_t expStart = position;
            consumeDigits();
            if (position == expStart) fail("Invalid JSON number");
        }

        JsonValue number;
        number.type = JsonValue::Type::Number;
        number.numberText = text.substr(start, position - start);
        try {
            number.numberValue = std::stod(number.numberText);
        } catch (const std::out_of_range&) {
            // Outside double range; the lexeme is still emitted verbatim.
            number.numberValue = 0.0;
        }
        return number;
    }
};

void renderPretty(const JsonValue& value, int indent, int depth, std::ostringstream& out) {
    const std::string pad(static_cast<size_t>(indent * (depth + 1)), ' ');
    const std::string closePad(static_cast<size_t>(indent * depth), ' ');

    if (value.isArray()) {
        if (value.arrayValue.empty()) {
            out << "[]";
            return;
        }
        out << "[\n";
        for (size_t i = 0; i < value.arrayValue.size(); ++i) {
            out << pad;
            renderPretty(value.arrayValue[i], indent, depth + 1, out);
            out << (i + 1 < value.arrayValue.size() ? ",\n" : "\n");
        }
        out << closePad << ']';
        return;
    }
    if (value.isObject()) {
        if (value.objectValue.empty()) {
            out << "{}";
            return;
        }
        out << "{\n";
        for (size_t i = 0; i < value.objectValue.size(); ++i) {
            const auto& member = value.objectValue[i];
            out << pad << '"' << escapeJsonString(member.first) << "\": ";
            renderPretty(member.second, indent, depth + 1, out);
            out << (i + 1 < value.objectValue.size() ? ",\n" : "\n");
        }
        out << closePad << '}';
        return;
    }
    out << value.dump();
}
} // namespace

const JsonValue* JsonValue::find(const std::string& key) const {
    if (!isObject()) return nullptr;
    for (const auto& member : objectValue) {
        if (member.first == key) return &member.second;
    }
    return nullptr;
}

std::string JsonValue::dump() const {
    switch (type) {
        case Type::Null:
            return "null";
        case Type::Bool:
            return booleanValue ? "true" : "false";
        case Type::Number: {
            if (!numberText.empty()) return numberText;
            std::ostringstream out;
            out << std::setprecision(15) << numberValue;
            return out.str();
        }
        case Type::String:
            return "\"" + escapeJsonString(stringValue) + "\"";
        case Type::Array: {
            std::string out = "[";
            for (size_t i = 0; i < arrayValue.size(); ++i) {
                if (i > 0) out += ',';
                out += arrayValue[i].dump();
            }
            return out + "]";
        }
        case Type::Object: {
            std::string out = "{";
            for (size_t i = 0; i < objectValue.size(); ++i) {
                if (i > 0) out += ',';
                out += "\"" + escapeJsonString(objectValue[i].first) + "\":" + objectValue[i].second.dump();
            }
            return out + "}";
        }
    }
    return "null";
}

std::string JsonValue::pretty(int indent) const {
    std::ostringstream out;
    renderPretty(*this, indent, 0, out);
    return out.str();
}

JsonValue parse(const std::string& text) {
    JsonParser parser(text);
    return parser.parse();
}

std::string escapeJsonString(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 8);
    for (char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    return out;
}

} // namespace JsonUtils
