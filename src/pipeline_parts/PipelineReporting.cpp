#include "RedactionPipeline.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {
std::string toFixed(double value, int precision = 2) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

std::vector<PiiEntity> sortedByStart(const std::vector<PiiEntity>& entities) {
    std::vector<PiiEntity> sorted = entities;
    std::stable_sort(sorted.begin(), sorted.end(), [](const PiiEntity& a, const PiiEntity& b) {
        return a.startPos < b.startPos;
    });
    return sorted;
}
} // namespace

std::string RedactionPipeline::buildDetailedReport(const DocumentResult& result) {
    std::ostringstream out;
    out << "PII Detection and Redaction Report\n";
    out << "=====================================\n\n";
    out << "File: " << result.name << "\n";
    out << "PII entities found: " << result.piiEntitiesFound << "\n";
    out << "Characters redacted: " << result.charactersRedacted << "\n\n";

    if (result.entities.empty()) {
        out << "No PII entities detected.\n";
        return out.str();
    }

    out << "Detected PII Entities:\n";
    out << "---------------------\n";
    size_t index = 0;
    for (const auto& entity : sortedByStart(result.entities)) {
        out << ++index << ". Type: " << entity.entityType << "\n";
        out << "   Text: " << entity.text << "\n";
        out << "   Confidence: " << toFixed(entity.confidence) << "\n";
        out << "   Position: " << entity.startPos << "-" << entity.endPos << "\n\n";
    }
    return out.str();
}

ReportEngine RedactionPipeline::buildMarkdownReport(const DocumentResult& result) {
    ReportEngine report;
    report.addTitle("PII Redaction Report: " + result.name);
    report.addParagraph("PII entities found: " + std::to_string(result.piiEntitiesFound) +
                        ". Characters redacted: " + std::to_string(result.charactersRedacted) +
                        " of " + std::to_string(result.originalLength) +
                        ". Processing time: " + toFixed(result.processingSeconds * 1000.0) + " ms.");

    if (result.entities.empty()) {
        report.addParagraph("No PII entities detected.");
        return report;
    }

    std::vector<std::vector<std::string>> countRows;
    for (const auto& entry : result.countsByType) {
        countRows.push_back({entry.first, std::to_string(entry.second)});
    }
    report.addTable("Entities by Type", {"Type", "Count"}, countRows);

    std::vector<std::vector<std::string>> entityRows;
    size_t index = 0;
    for (const auto& entity : sortedByStart(result.entities)) {
        entityRows.push_back({
            std::to_string(++index),
            entity.entityType,
            entity.text,
            toFixed(entity.confidence),
            std::to_string(entity.startPos),
            std::to_string(entity.endPos)
        });
    }
    report.addTable("Detected PII Entities", {"#", "Type", "Text", "Confidence", "Start", "End"}, entityRows);
    return report;
}
