#pragma once

#include "PiiEntity.h"

#include <vector>

enum class OverlapStrategy {
    FIRST_CONFLICT,  // scan order, replace on strictly higher confidence
    BEST_CONFIDENCE  // greedy interval selection by descending confidence
};

namespace OverlapResolver {

// Any non-empty intersection of the two half-open spans.
inline bool overlaps(const PiiEntity& a, const PiiEntity& b) {
    return a.startPos < b.endPos && a.endPos > b.startPos;
}

/**
 * @brief Reduces candidates to a pairwise non-overlapping set.
 *
 * FIRST_CONFLICT: candidates are stably sorted by start offset; each one is
 * compared with the first accepted entity it overlaps and replaces it only on
 * strictly higher confidence (the replacement is appended). Because accepted
 * entities never start after the candidate, at most one of them can overlap it.
 *
 * BEST_CONFIDENCE: higher confidence first, then earlier start, then longer
 * span; output sorted by start offset.
 */
std::vector<PiiEntity> resolve(std::vector<PiiEntity> candidates,
                               OverlapStrategy strategy = OverlapStrategy::FIRST_CONFLICT);

} // namespace OverlapResolver
