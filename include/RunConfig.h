#pragma once
#include <string>
#include <vector>

struct ServiceConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    size_t threadCount = 8;
};

struct RunConfig {
    std::vector<std::string> inputPaths;
    std::string outputDir = ".";
    std::string marker = "\xE2\x96\x88";             // U+2588 full block
    char delimiter = ',';
    std::string reportFormat = "txt";                 // txt|md|both|none
    std::string overlapStrategy = "first_conflict";   // first_conflict|best_confidence
    std::string lineOffsets = "first_occurrence";     // first_occurrence|cumulative
    std::string contextualOffsets = "anchored";       // anchored|exact
    std::vector<std::string> excludedTypes;

    bool verbose = false;
    bool printEntities = false;
    // OpenMP worker threads for batch runs; 0 keeps the runtime default.
    int threads = 0;
    bool showHelp = false;

    ServiceConfig service;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * Positional arguments are input paths.
     * @param requireInputs false for the HTTP service, which reads no files.
     * @post Returns a validated config object unless --help was given.
     * @throws Veil::ConfigurationException on invalid arguments or values.
     */
    static RunConfig fromArgs(int argc, char* argv[], bool requireInputs = true);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws Veil::ConfigurationException on parse/validation failures.
     */
    static RunConfig fromFile(const std::string& configPath, const RunConfig& base);

    /**
     * @brief Validates enum-like fields, marker, delimiter and ranges.
     * @throws Veil::ConfigurationException on invalid values.
     */
    void validate(bool requireInputs = true) const;
};
