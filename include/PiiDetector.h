#pragma once

#include "CandidateExtractor.h"
#include "OverlapResolver.h"
#include "PatternCatalog.h"
#include "PiiEntity.h"

#include <memory>
#include <string>
#include <vector>

struct DetectorOptions {
    OverlapStrategy overlapStrategy = OverlapStrategy::FIRST_CONFLICT;
    LineOffsetMode lineOffsets = LineOffsetMode::FIRST_OCCURRENCE;
    ContextualOffsetMode contextualOffsets = ContextualOffsetMode::ANCHORED;
    std::vector<std::string> excludedTypes;
};

class PiiDetector {
public:
    PiiDetector();

    /**
     * @throws Veil::ConfigurationException if excludedTypes names an unknown type.
     */
    explicit PiiDetector(const DetectorOptions& options);

    /**
     * @brief Runs the three detection passes and overlap resolution.
     * @post Result is pairwise non-overlapping and identical for identical input.
     * Never throws for any input, including the empty string.
     */
    std::vector<PiiEntity> detectAll(const std::string& text) const;

    const PatternCatalog& catalog() const { return extractor_.catalog(); }
    const DetectorOptions& options() const { return options_; }

private:
    DetectorOptions options_;
    CandidateExtractor extractor_;
};
