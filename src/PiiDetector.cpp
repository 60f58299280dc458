#include "PiiDetector.h"

namespace {
std::shared_ptr<const PatternCatalog> catalogFor(const DetectorOptions& options) {
    if (options.excludedTypes.empty()) return PatternCatalog::defaults();
    return PatternCatalog::defaults()->withoutTypes(options.excludedTypes);
}
} // namespace

PiiDetector::PiiDetector() : PiiDetector(DetectorOptions{}) {}

PiiDetector::PiiDetector(const DetectorOptions& options)
    : options_(options), extractor_(catalogFor(options), options.lineOffsets, options.contextualOffsets) {}

std::vector<PiiEntity> PiiDetector::detectAll(const std::string& text) const {
    if (text.empty()) return {};
    return OverlapResolver::resolve(extractor_.extractAll(text), options_.overlapStrategy);
}
