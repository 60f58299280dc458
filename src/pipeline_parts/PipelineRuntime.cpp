#include "RedactionPipeline.h"

#include "TerminalUI.h"
#include "VeilExceptions.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <unordered_map>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
struct DocumentOutcome {
    std::optional<DocumentResult> result;
    std::string error;
    std::vector<std::string> writtenFiles;
};

void writeTextFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) throw Veil::IOException("Could not open output file: " + path.string());
    out << content;
    if (!out.good()) throw Veil::IOException("Failed while writing output file: " + path.string());
}

// Two inputs sharing a stem would write the same files; later ones get "_2", "_3", ...
std::vector<std::string> assignOutputStems(const std::vector<std::string>& inputPaths) {
    std::vector<std::string> stems;
    stems.reserve(inputPaths.size());
    std::unordered_map<std::string, size_t> seen;
    for (const auto& path : inputPaths) {
        const std::string stem = RedactionPipeline::outputStem(path);
        const size_t count = ++seen[stem];
        stems.push_back(count == 1 ? stem : stem + "_" + std::to_string(count));
    }
    return stems;
}

std::vector<std::string> writeOutputs(const DocumentResult& result,
                                      const std::filesystem::path& outputDir,
                                      const std::string& stem,
                                      const std::string& reportFormat) {
    std::vector<std::string> written;

    const std::filesystem::path redactedPath = outputDir / (stem + "_redacted.txt");
    writeTextFile(redactedPath, result.redactedText);
    written.push_back(redactedPath.string());

    if (reportFormat == "txt" || reportFormat == "both") {
        const std::filesystem::path reportPath = outputDir / (stem + "_report.txt");
        writeTextFile(reportPath, result.report);
        written.push_back(reportPath.string());
    }
    if (reportFormat == "md" || reportFormat == "both") {
        const std::filesystem::path reportPath = outputDir / (stem + "_report.md");
        RedactionPipeline::buildMarkdownReport(result).save(reportPath.string());
        written.push_back(reportPath.string());
    }
    return written;
}
} // namespace

int RedactionPipeline::run(const RunConfig& config) {
    const auto started = std::chrono::steady_clock::now();
    const RedactionPipeline pipeline(PipelineOptions::fromConfig(config));

    const std::filesystem::path outputDir(config.outputDir);
    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        std::cerr << "[Veil Error] Could not create output directory " << outputDir.string() << ": " << ec.message() << "\n";
        return 1;
    }

    const std::vector<std::string>& inputs = config.inputPaths;
    const std::vector<std::string> stems = assignOutputStems(inputs);
    std::vector<DocumentOutcome> outcomes(inputs.size());

    if (config.verbose) {
        std::cout << "[Veil] Processing " << inputs.size() << " document(s) into " << outputDir.string() << "\n";
    }

#ifdef USE_OPENMP
    if (config.threads > 0) omp_set_num_threads(config.threads);
#endif

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t i = 0; i < inputs.size(); ++i) {
        DocumentOutcome& outcome = outcomes[i];
        try {
            DocumentResult result = pipeline.processFile(inputs[i]);
            outcome.writtenFiles = writeOutputs(result, outputDir, stems[i], config.reportFormat);
            outcome.result = std::move(result);
        } catch (const Veil::VeilException& e) {
            outcome.error = e.what();
        } catch (const std::exception& e) {
            outcome.error = std::string("Unexpected failure: ") + e.what();
        }
    }

    size_t failed = 0;
    size_t totalEntities = 0;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        const DocumentOutcome& outcome = outcomes[i];
        if (!outcome.result) {
            ++failed;
            std::cerr << "[Veil Error] " << inputs[i] << ": " << outcome.error << "\n";
            continue;
        }

        totalEntities += outcome.result->piiEntitiesFound;
        TerminalUI::printDocumentSummary(*outcome.result);
        if (config.printEntities && !outcome.result->entities.empty()) {
            TerminalUI::printEntityTable(outcome.result->entities);
        }
        if (config.verbose) {
            for (const auto& file : outcome.writtenFiles) {
                std::cout << "[Veil] Wrote " << file << "\n";
            }
        }
    }

    const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    TerminalUI::printBatchSummary(inputs.size(), failed, totalEntities, seconds);
    return failed == 0 ? 0 : 1;
}
