#pragma once

#include "PiiDetector.h"
#include "ReportEngine.h"
#include "RunConfig.h"
#include "TextAcquisition.h"

#include <map>
#include <string>
#include <vector>

struct PipelineOptions {
    std::string marker = "\xE2\x96\x88";
    AcquisitionOptions acquisition;
    DetectorOptions detector;

    // Maps the validated string settings of a run onto typed options.
    static PipelineOptions fromConfig(const RunConfig& config);
};

struct DocumentResult {
    std::string name;
    std::string originalText;
    std::string redactedText;
    std::vector<PiiEntity> entities;

    size_t piiEntitiesFound = 0;
    // Lengths are in UTF-8 code points.
    size_t originalLength = 0;
    size_t redactedLength = 0;
    size_t charactersRedacted = 0;
    double processingSeconds = 0.0;

    std::map<std::string, size_t> countsByType;
    std::string report;
};

class RedactionPipeline final {
public:
    RedactionPipeline();

    /**
     * @throws Veil::ConfigurationException if the detector options name an unknown entity type.
     */
    explicit RedactionPipeline(PipelineOptions options);

    /**
     * @brief Detects, resolves and redacts one in-memory document.
     * @post result.entities are pairwise non-overlapping; with a one-character
     * marker result.redactedLength == result.originalLength.
     * Never throws for any input text.
     */
    DocumentResult processText(const std::string& text, const std::string& name) const;
    DocumentResult processText(const std::string& text, const std::string& name, const std::string& marker) const;

    /**
     * @brief Acquires a file's text by extension, then runs processText on it.
     * @throws Veil::AcquisitionException prefixed "Error processing document: "
     * when the source cannot be read or parsed.
     */
    DocumentResult processFile(const std::string& path) const;

    const PipelineOptions& options() const { return options_; }
    const PiiDetector& detector() const { return detector_; }

    // Plain-text report stored in DocumentResult::report.
    static std::string buildDetailedReport(const DocumentResult& result);
    static ReportEngine buildMarkdownReport(const DocumentResult& result);

    // File name up to its first dot; "document" when that is empty.
    static std::string outputStem(const std::string& path);

    /**
     * @brief Batch entry point: processes every input path and writes
     * `<stem>_redacted.txt` plus the configured reports into config.outputDir.
     * @return 0 when every document succeeded, 1 otherwise.
     */
    static int run(const RunConfig& config);

private:
    PipelineOptions options_;
    PiiDetector detector_;
};
