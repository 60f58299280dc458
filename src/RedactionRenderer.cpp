#include "RedactionRenderer.h"

#include "CommonUtils.h"

#include <algorithm>
#include <functional>

namespace {
// Splices from the highest start offset down, so offsets still pending are
// never shifted by an earlier replacement.
std::string spliceDescending(const std::string& text,
                             const std::vector<PiiEntity>& entities,
                             const std::function<std::string(const PiiEntity&)>& replacementFor) {
    if (entities.empty()) return text;

    std::vector<const PiiEntity*> ordered;
    ordered.reserve(entities.size());
    for (const auto& entity : entities) {
        if (entity.startPos < entity.endPos && entity.endPos <= text.size()) {
            ordered.push_back(&entity);
        }
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const PiiEntity* a, const PiiEntity* b) {
        return a->startPos > b->startPos;
    });

    std::string redacted = text;
    for (const PiiEntity* entity : ordered) {
        redacted.replace(entity->startPos, entity->endPos - entity->startPos, replacementFor(*entity));
    }
    return redacted;
}
} // namespace

namespace RedactionRenderer {

std::string redact(const std::string& text, const std::vector<PiiEntity>& entities, char marker) {
    return spliceDescending(text, entities, [marker](const PiiEntity& entity) {
        return std::string(entity.length(), marker);
    });
}

std::string redact(const std::string& text, const std::vector<PiiEntity>& entities, const std::string& marker) {
    return spliceDescending(text, entities, [&text, &marker](const PiiEntity& entity) {
        const size_t count = CommonUtils::utf8Length(
            std::string_view(text).substr(entity.startPos, entity.length()));
        std::string run;
        run.reserve(count * marker.size());
        for (size_t i = 0; i < count; ++i) run += marker;
        return run;
    });
}

} // namespace RedactionRenderer
