#include "RunConfig.h"
#include "CommonUtils.h"
#include "PatternCatalog.h"
#include "VeilExceptions.h"
#include <algorithm>
#include <fstream>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Veil::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Veil::VeilException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Veil::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue, int maxValue) {
    const int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue || parsed > maxValue) {
        throw Veil::ConfigurationException("Value for " + key + " must be within [" +
                                           std::to_string(minValue) + "," + std::to_string(maxValue) + "]");
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Veil::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& value, const std::string& key) {
    if (value == "\\t" || CommonUtils::toLower(value) == "tab") return '\t';
    if (value.size() != 1) throw Veil::ConfigurationException(key + " expects a single character");
    return value[0];
}

// Drops braces outside quotes and a trailing comma, so `"key": "value",`
// lines from a JSON object read the same as YAML `key: value`.
std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
        } else if (c == '\\') {
            out.push_back(c);
            escaped = true;
        } else if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
        } else if (inQuotes || (c != '{' && c != '}')) {
            out.push_back(c);
        }
    }

    const size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '\\') {
            ++i;
        } else if (c == '"') {
            inQuotes = !inQuotes;
        } else if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

void assignKeyValue(RunConfig& config, const std::string& key, const std::string& value) {
    if (key == "inputs" || key == "input") {
        const auto paths = CommonUtils::splitList(value);
        config.inputPaths.insert(config.inputPaths.end(), paths.begin(), paths.end());
    } else if (key == "output_dir") {
        config.outputDir = value;
    } else if (key == "marker") {
        config.marker = value;
    } else if (key == "delimiter") {
        config.delimiter = parseDelimiter(value, key);
    } else if (key == "report_format" || key == "report") {
        config.reportFormat = CommonUtils::toLower(value);
    } else if (key == "overlap_strategy") {
        config.overlapStrategy = CommonUtils::toLower(value);
    } else if (key == "line_offsets") {
        config.lineOffsets = CommonUtils::toLower(value);
    } else if (key == "contextual_offsets") {
        config.contextualOffsets = CommonUtils::toLower(value);
    } else if (key == "exclude_types") {
        config.excludedTypes = CommonUtils::splitList(value);
    } else if (key == "verbose") {
        config.verbose = parseBoolStrict(value, key);
    } else if (key == "print_entities") {
        config.printEntities = parseBoolStrict(value, key);
    } else if (key == "threads") {
        config.threads = parseIntStrict(value, key, 0, 1024);
    } else if (key == "host") {
        config.service.host = value;
    } else if (key == "port") {
        config.service.port = parseIntStrict(value, key, 1, 65535);
    } else if (key == "service_threads") {
        config.service.threadCount = static_cast<size_t>(parseIntStrict(value, key, 1, 1024));
    } else {
        throw Veil::ConfigurationException("Unknown config key: " + key);
    }
}

bool takesValue(const std::string& flag) {
    static const std::vector<std::string> valued = {
        "--config", "--output-dir", "-o", "--marker", "--delimiter", "--report",
        "--overlap-strategy", "--line-offsets", "--contextual-offsets", "--exclude-types", "--threads",
        "--host", "--port", "--service-threads"
    };
    return std::find(valued.begin(), valued.end(), flag) != valued.end();
}
} // namespace

RunConfig RunConfig::fromArgs(int argc, char* argv[], bool requireInputs) {
    RunConfig config;

    // The config file is the base layer; command-line flags override it.
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) throw Veil::ConfigurationException("--config expects a file path");
            config = fromFile(argv[i + 1], config);
            break;
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            return config;
        }
        if (takesValue(arg) && i + 1 >= argc) {
            throw Veil::ConfigurationException(arg + " expects a value");
        }

        if (arg == "--config") {
            ++i;
        } else if (arg == "--output-dir" || arg == "-o") {
            config.outputDir = argv[++i];
        } else if (arg == "--marker") {
            config.marker = argv[++i];
        } else if (arg == "--delimiter") {
            config.delimiter = parseDelimiter(argv[++i], arg);
        } else if (arg == "--report") {
            config.reportFormat = CommonUtils::toLower(argv[++i]);
        } else if (arg == "--overlap-strategy") {
            config.overlapStrategy = CommonUtils::toLower(argv[++i]);
        } else if (arg == "--line-offsets") {
            config.lineOffsets = CommonUtils::toLower(argv[++i]);
        } else if (arg == "--contextual-offsets") {
            config.contextualOffsets = CommonUtils::toLower(argv[++i]);
        } else if (arg == "--exclude-types") {
            config.excludedTypes = CommonUtils::splitList(argv[++i]);
        } else if (arg == "--threads") {
            config.threads = parseIntStrict(argv[++i], arg, 0, 1024);
        } else if (arg == "--host") {
            config.service.host = argv[++i];
        } else if (arg == "--port") {
            config.service.port = parseIntStrict(argv[++i], arg, 1, 65535);
        } else if (arg == "--service-threads") {
            config.service.threadCount = static_cast<size_t>(parseIntStrict(argv[++i], arg, 1, 1024));
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--print-entities") {
            config.printEntities = true;
        } else if (arg.rfind("-", 0) == 0 && arg.size() > 1) {
            throw Veil::ConfigurationException("Unknown argument: " + arg);
        } else {
            config.inputPaths.push_back(arg);
        }
    }

    config.validate(requireInputs);
    return config;
}

RunConfig RunConfig::fromFile(const std::string& configPath, const RunConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Veil::ConfigurationException("Could not open config file: " + configPath);

    RunConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Veil::VeilException& ex) {
            throw Veil::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

void RunConfig::validate(bool requireInputs) const {
    if (requireInputs && inputPaths.empty()) {
        throw Veil::ConfigurationException("at least one input file is required");
    }

    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (marker.empty() || CommonUtils::utf8Length(marker) != 1) {
        throw Veil::ConfigurationException("marker must be exactly one character");
    }
    if (marker == "\n" || marker == "\r") {
        throw Veil::ConfigurationException("marker cannot be a line break");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r' || delimiter == '\0') {
        throw Veil::ConfigurationException("Invalid delimiter character");
    }
    if (!isIn(reportFormat, {"txt", "md", "both", "none"})) {
        throw Veil::ConfigurationException("report_format must be one of: txt, md, both, none");
    }
    if (!isIn(overlapStrategy, {"first_conflict", "best_confidence"})) {
        throw Veil::ConfigurationException("overlap_strategy must be one of: first_conflict, best_confidence");
    }
    if (!isIn(lineOffsets, {"first_occurrence", "cumulative"})) {
        throw Veil::ConfigurationException("line_offsets must be one of: first_occurrence, cumulative");
    }
    if (!isIn(contextualOffsets, {"anchored", "exact"})) {
        throw Veil::ConfigurationException("contextual_offsets must be one of: anchored, exact");
    }
    if (outputDir.empty()) {
        throw Veil::ConfigurationException("output_dir cannot be empty");
    }
    if (threads < 0) {
        throw Veil::ConfigurationException("threads must be >= 0");
    }
    if (service.port < 1 || service.port > 65535) {
        throw Veil::ConfigurationException("port must be within [1,65535]");
    }
    if (service.threadCount == 0) {
        throw Veil::ConfigurationException("service_threads must be >= 1");
    }

    const std::vector<std::string> known = PatternCatalog::defaults()->entityTypes();
    for (const auto& type : excludedTypes) {
        if (!isIn(type, known)) {
            throw Veil::ConfigurationException("exclude_types names an unknown entity type: " + type);
        }
    }
}
