#pragma once

#include "PatternCatalog.h"
#include "PiiEntity.h"

#include <memory>
#include <string>
#include <vector>

// How the keyword pass maps a line back to an absolute offset.
enum class LineOffsetMode {
    FIRST_OCCURRENCE, // position of the line's first copy in the text; duplicate lines share it
    CUMULATIVE        // running line-start offset
};

// Where a keyword capture's span starts.
enum class ContextualOffsetMode {
    ANCHORED, // keyword end + offset of the whole match in the trimmed tail + 1
    EXACT     // span covers exactly the trimmed captured value
};

class CandidateExtractor {
public:
    static constexpr size_t kMinHeuristicLength = 3;

    explicit CandidateExtractor(std::shared_ptr<const PatternCatalog> catalog,
                                LineOffsetMode lineOffsets = LineOffsetMode::FIRST_OCCURRENCE,
                                ContextualOffsetMode contextualOffsets = ContextualOffsetMode::ANCHORED);

    std::vector<PiiEntity> structuralPass(const std::string& text) const;
    std::vector<PiiEntity> heuristicPass(const std::string& text) const;

    /**
     * @brief Keyword-anchored extraction, one line at a time.
     * For each keyword found in the lower-cased line, captures the first run of
     * 3-30 characters from [A-Za-z0-9 -] after a colon/whitespace separator.
     * In ANCHORED mode the span starts one byte past the separator run's start
     * and has the value's length, so it can begin inside the separator.
     */
    std::vector<PiiEntity> contextualPass(const std::string& text) const;

    // Structural, heuristic, then contextual candidates, unresolved.
    std::vector<PiiEntity> extractAll(const std::string& text) const;

    const PatternCatalog& catalog() const { return *catalog_; }

private:
    std::shared_ptr<const PatternCatalog> catalog_;
    LineOffsetMode lineOffsets_;
    ContextualOffsetMode contextualOffsets_;
};
