#pragma once

#include "PiiEntity.h"

#include <memory>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

struct PatternRule {
    std::string name;        // entity type tag emitted for matches
    DetectorCategory category;
    std::regex pattern;
};

namespace PatternScan {
struct Match {
    size_t position = 0;
    std::string text;
};

// std::regex recurses once per character a repeat consumes, so the matcher
// never sees more than kWindowBytes at a time. Windows overlap by
// kMaxMatchBytes; a match up to that length is found exactly as on the full text.
constexpr size_t kWindowBytes = 2048;
constexpr size_t kMaxMatchBytes = 256;

/**
 * @brief Collects every non-overlapping match of pattern in text, left to right.
 * @post Returned positions are absolute and strictly increasing; a zero-width
 * match advances the scan by one byte. No state survives the call.
 * Runs longer than kMaxMatchBytes may be missed or reported in part.
 */
std::vector<Match> findAll(const std::regex& pattern, const std::string& text);
} // namespace PatternScan

/**
 * Immutable detector tables. The default instance is compiled once and shared
 * read-only between documents and threads.
 */
class PatternCatalog {
public:
    static constexpr const char* kHeuristicPrefix = "builtin_";
    static constexpr const char* kContextualType = "contextual_pii";

    PatternCatalog();

    static std::shared_ptr<const PatternCatalog> defaults();

    const std::vector<PatternRule>& structuralRules() const { return structural_; }
    const std::vector<PatternRule>& heuristicRules() const { return heuristic_; }
    const std::vector<std::string>& contextualKeywords() const { return keywords_; }

    bool isDenylisted(const std::string& text) const;

    // Every entity type tag this catalog can emit, in catalog order.
    std::vector<std::string> entityTypes() const;

    /**
     * @brief Copy of the catalog with the named entity types disabled.
     * `contextual_pii` disables the keyword pass.
     * @throws Veil::ConfigurationException on an unknown type name.
     */
    std::shared_ptr<const PatternCatalog> withoutTypes(const std::vector<std::string>& types) const;

private:
    std::vector<PatternRule> structural_;
    std::vector<PatternRule> heuristic_;
    std::vector<std::string> keywords_;
    std::unordered_set<std::string> denylist_;
};
