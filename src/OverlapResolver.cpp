#include "OverlapResolver.h"

#include <algorithm>
#include <utility>

namespace {
std::vector<PiiEntity> resolveFirstConflict(std::vector<PiiEntity> candidates) {
    std::stable_sort(candidates.begin(), candidates.end(), [](const PiiEntity& a, const PiiEntity& b) {
        return a.startPos < b.startPos;
    });

    std::vector<PiiEntity> accepted;
    accepted.reserve(candidates.size());
    for (auto& candidate : candidates) {
        auto conflict = std::find_if(accepted.begin(), accepted.end(), [&](const PiiEntity& existing) {
            return OverlapResolver::overlaps(candidate, existing);
        });

        if (conflict == accepted.end()) {
            accepted.push_back(std::move(candidate));
        } else if (candidate.confidence > conflict->confidence) {
            accepted.erase(conflict);
            accepted.push_back(std::move(candidate));
        }
    }
    return accepted;
}

std::vector<PiiEntity> resolveBestConfidence(std::vector<PiiEntity> candidates) {
    std::stable_sort(candidates.begin(), candidates.end(), [](const PiiEntity& a, const PiiEntity& b) {
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        if (a.startPos != b.startPos) return a.startPos < b.startPos;
        return a.length() > b.length();
    });

    std::vector<PiiEntity> accepted;
    accepted.reserve(candidates.size());
    for (auto& candidate : candidates) {
        const bool clashes = std::any_of(accepted.begin(), accepted.end(), [&](const PiiEntity& existing) {
            return OverlapResolver::overlaps(candidate, existing);
        });
        if (!clashes) accepted.push_back(std::move(candidate));
    }

    std::stable_sort(accepted.begin(), accepted.end(), [](const PiiEntity& a, const PiiEntity& b) {
        return a.startPos < b.startPos;
    });
    return accepted;
}
} // namespace

namespace OverlapResolver {

std::vector<PiiEntity> resolve(std::vector<PiiEntity> candidates, OverlapStrategy strategy) {
    if (candidates.empty()) return candidates;
    switch (strategy) {
        case OverlapStrategy::FIRST_CONFLICT: return resolveFirstConflict(std::move(candidates));
        case OverlapStrategy::BEST_CONFIDENCE: return resolveBestConfidence(std::move(candidates));
    }
    return resolveFirstConflict(std::move(candidates));
}

} // namespace OverlapResolver
