#include "RedactionPipeline.h"

#include "CommonUtils.h"
#include "RedactionRenderer.h"
#include "VeilExceptions.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <utility>

PipelineOptions PipelineOptions::fromConfig(const RunConfig& config) {
    PipelineOptions options;
    options.marker = config.marker;
    options.acquisition.delimiter = config.delimiter;
    options.detector.overlapStrategy = config.overlapStrategy == "best_confidence"
        ? OverlapStrategy::BEST_CONFIDENCE
        : OverlapStrategy::FIRST_CONFLICT;
    options.detector.lineOffsets = config.lineOffsets == "cumulative"
        ? LineOffsetMode::CUMULATIVE
        : LineOffsetMode::FIRST_OCCURRENCE;
    options.detector.contextualOffsets = config.contextualOffsets == "exact"
        ? ContextualOffsetMode::EXACT
        : ContextualOffsetMode::ANCHORED;
    options.detector.excludedTypes = config.excludedTypes;
    return options;
}

RedactionPipeline::RedactionPipeline()
    : RedactionPipeline(PipelineOptions{}) {}

RedactionPipeline::RedactionPipeline(PipelineOptions options)
    : options_(std::move(options)),
      detector_(options_.detector) {}

DocumentResult RedactionPipeline::processText(const std::string& text, const std::string& name) const {
    return processText(text, name, options_.marker);
}

DocumentResult RedactionPipeline::processText(const std::string& text,
                                              const std::string& name,
                                              const std::string& marker) const {
    const auto started = std::chrono::steady_clock::now();

    DocumentResult result;
    result.name = name;
    result.originalText = text;
    result.entities = detector_.detectAll(text);
    result.redactedText = RedactionRenderer::redact(text, result.entities, marker);

    size_t redacted = 0;
    for (const auto& entity : result.entities) {
        redacted += CommonUtils::utf8Length(entity.text);
        ++result.countsByType[entity.entityType];
    }
    result.piiEntitiesFound = result.entities.size();
    result.originalLength = CommonUtils::utf8Length(text);
    result.redactedLength = CommonUtils::utf8Length(result.redactedText);
    result.charactersRedacted = std::min(redacted, result.originalLength);
    result.report = buildDetailedReport(result);

    result.processingSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    return result;
}

DocumentResult RedactionPipeline::processFile(const std::string& path) const {
    AcquiredText acquired;
    try {
        acquired = TextAcquisition::acquireText(path, options_.acquisition);
    } catch (const Veil::AcquisitionException& e) {
        // Keep a single category prefix on the rewrapped message.
        std::string cause = e.what();
        const std::string prefix = Veil::AcquisitionException::kPrefix;
        if (cause.compare(0, prefix.size(), prefix) == 0) cause.erase(0, prefix.size());
        throw Veil::AcquisitionException("Error processing document: " + cause);
    } catch (const std::exception& e) {
        throw Veil::AcquisitionException(std::string("Error processing document: ") + e.what());
    }
    return processText(acquired.text, std::filesystem::path(path).filename().string());
}

std::string RedactionPipeline::outputStem(const std::string& path) {
    const std::string fileName = std::filesystem::path(path).filename().string();
    const std::string stem = fileName.substr(0, fileName.find('.'));
    return stem.empty() ? "document" : stem;
}
