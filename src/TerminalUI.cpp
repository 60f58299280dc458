#include "TerminalUI.h"
#include "CommonUtils.h"
#include <algorithm>
#include <iostream>
#include <iomanip>

namespace {
constexpr size_t kTextColumnCap = 32;

std::string clip(const std::string& text, size_t cap) {
    std::string flat = text;
    std::replace(flat.begin(), flat.end(), '\n', ' ');
    if (CommonUtils::utf8Length(flat) <= cap) return flat;
    return CommonUtils::utf8Prefix(flat, cap - 3) + "...";
}
} // namespace

void TerminalUI::printDocumentSummary(const DocumentResult& result) {
    std::cout << "\n[Veil] " << result.name << "\n";
    std::cout << std::left
              << "  " << std::setw(22) << "PII entities found" << result.piiEntitiesFound << "\n"
              << "  " << std::setw(22) << "Original length" << result.originalLength << "\n"
              << "  " << std::setw(22) << "Characters redacted" << result.charactersRedacted << "\n"
              << "  " << std::setw(22) << "Processing time" << std::fixed << std::setprecision(2)
              << (result.processingSeconds * 1000.0) << " ms\n";
    for (const auto& entry : result.countsByType) {
        std::cout << "    - " << std::setw(26) << entry.first << entry.second << "\n";
    }
}

void TerminalUI::printEntityTable(const std::vector<PiiEntity>& entities) {
    size_t typeWidth = 12;
    for (const auto& e : entities) typeWidth = std::max(typeWidth, e.entityType.size());

    const int w = static_cast<int>(typeWidth) + 2;
    const int textWidth = static_cast<int>(kTextColumnCap) + 2;
    std::cout << "\n=================================== DETECTED ENTITIES ===================================\n";
    std::cout << std::left
              << std::setw(w) << "Type"
              << std::setw(textWidth) << "Text"
              << std::setw(12) << "Start"
              << std::setw(12) << "End"
              << "Confidence\n";
    std::cout << std::string(static_cast<size_t>(w + textWidth + 12 * 2 + 10), '-') << "\n";

    for (const auto& e : entities) {
        std::cout << std::left << std::setw(w) << e.entityType
                  << std::setw(textWidth) << clip(e.text, kTextColumnCap)
                  << std::setw(12) << e.startPos
                  << std::setw(12) << e.endPos
                  << std::fixed << std::setprecision(2) << e.confidence << "\n";
    }
    std::cout << "=========================================================================================\n";
}

void TerminalUI::printBatchSummary(size_t documents, size_t failed, size_t entities, double seconds) {
    std::cout << "\n[Veil] Processed " << (documents - failed) << "/" << documents << " documents, "
              << entities << " PII entities redacted in "
              << std::fixed << std::setprecision(2) << seconds << "s";
    if (failed > 0) std::cout << " (" << failed << " failed)";
    std::cout << "\n";
}
