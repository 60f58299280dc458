#pragma once

#include <cstddef>
#include <string>

enum class DetectorCategory { STRUCTURAL, HEURISTIC, CONTEXTUAL };

// Fixed per-category weights. Structural > heuristic > contextual is relied on
// by the overlap resolver when detections of different kinds collide.
namespace Confidence {
constexpr double kStructural = 0.8;
constexpr double kHeuristic = 0.7;
constexpr double kContextual = 0.6;
}

constexpr double confidenceFor(DetectorCategory category) {
    return category == DetectorCategory::STRUCTURAL ? Confidence::kStructural
         : category == DetectorCategory::HEURISTIC ? Confidence::kHeuristic
         : Confidence::kContextual;
}

/**
 * @brief One detected span. Offsets are half-open byte positions into the
 * original text and are never re-based after detection.
 */
struct PiiEntity {
    std::string text;
    std::string entityType;
    size_t startPos = 0;
    size_t endPos = 0;
    double confidence = 1.0;

    size_t length() const { return endPos - startPos; }

    bool operator==(const PiiEntity& other) const {
        return text == other.text &&
               entityType == other.entityType &&
               startPos == other.startPos &&
               endPos == other.endPos &&
               confidence == other.confidence;
    }
    bool operator!=(const PiiEntity& other) const { return !(*this == other); }
};
