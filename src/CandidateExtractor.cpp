#include "CandidateExtractor.h"

#include "CommonUtils.h"

#include <iterator>
#include <regex>
#include <utility>

namespace {
const std::regex& contextualValuePattern() {
    static const std::regex pattern(R"([:\s]+([A-Za-z0-9\-\s]{3,30}))");
    return pattern;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        const size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

void appendAll(std::vector<PiiEntity>& out, std::vector<PiiEntity>&& more) {
    out.insert(out.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
}
} // namespace

CandidateExtractor::CandidateExtractor(std::shared_ptr<const PatternCatalog> catalog,
                                       LineOffsetMode lineOffsets,
                                       ContextualOffsetMode contextualOffsets)
    : catalog_(std::move(catalog)), lineOffsets_(lineOffsets), contextualOffsets_(contextualOffsets) {}

std::vector<PiiEntity> CandidateExtractor::structuralPass(const std::string& text) const {
    std::vector<PiiEntity> entities;
    for (const auto& rule : catalog_->structuralRules()) {
        for (auto& match : PatternScan::findAll(rule.pattern, text)) {
            if (match.text.empty()) continue;
            const size_t start = match.position;
            const size_t end = start + match.text.size();
            entities.push_back({std::move(match.text), rule.name, start, end, Confidence::kStructural});
        }
    }
    return entities;
}

std::vector<PiiEntity> CandidateExtractor::heuristicPass(const std::string& text) const {
    std::vector<PiiEntity> entities;
    for (const auto& rule : catalog_->heuristicRules()) {
        for (const auto& match : PatternScan::findAll(rule.pattern, text)) {
            std::string matched = CommonUtils::trim(match.text);
            if (matched.size() < kMinHeuristicLength || catalog_->isDenylisted(matched)) continue;

            const size_t start = match.position + CommonUtils::leadingWhitespace(match.text);
            const size_t end = start + matched.size();
            entities.push_back({std::move(matched), rule.name, start, end, Confidence::kHeuristic});
        }
    }
    return entities;
}

std::vector<PiiEntity> CandidateExtractor::contextualPass(const std::string& text) const {
    std::vector<PiiEntity> entities;
    const auto& keywords = catalog_->contextualKeywords();
    if (keywords.empty()) return entities;

    size_t runningLineStart = 0;
    for (const auto& line : splitLines(text)) {
        const size_t cumulativeStart = runningLineStart;
        runningLineStart += line.size() + 1;

        const std::string lineLower = CommonUtils::toLower(line);
        size_t lineStart = std::string::npos;
        for (const auto& keyword : keywords) {
            const size_t keywordPos = lineLower.find(keyword);
            if (keywordPos == std::string::npos) continue;

            const std::string tail = line.substr(keywordPos + keyword.size());
            // The capture is at most 30 bytes, so a window-sized prefix of the
            // tail is enough and keeps regex recursion bounded.
            const std::string afterKeyword = CommonUtils::trim(tail).substr(0, PatternScan::kWindowBytes);

            std::smatch m;
            if (!std::regex_search(afterKeyword, m, contextualValuePattern())) continue;

            const std::string captured = m.str(1);
            std::string value = CommonUtils::trim(captured);
            if (value.size() <= 2) continue;

            if (lineStart == std::string::npos) {
                lineStart = lineOffsets_ == LineOffsetMode::CUMULATIVE ? cumulativeStart : text.find(line);
            }
            const size_t keywordEnd = lineStart + keywordPos + keyword.size();
            const size_t startPos = contextualOffsets_ == ContextualOffsetMode::EXACT
                ? keywordEnd + CommonUtils::leadingWhitespace(tail) + static_cast<size_t>(m.position(1))
                      + CommonUtils::leadingWhitespace(captured)
                : keywordEnd + static_cast<size_t>(m.position(0)) + 1;
            const size_t endPos = startPos + value.size();
            entities.push_back({std::move(value), PatternCatalog::kContextualType, startPos, endPos,
                                Confidence::kContextual});
        }
    }
    return entities;
}

std::vector<PiiEntity> CandidateExtractor::extractAll(const std::string& text) const {
    std::vector<PiiEntity> all = structuralPass(text);
    appendAll(all, heuristicPass(text));
    appendAll(all, contextualPass(text));
    return all;
}
