#pragma once
#include "PiiEntity.h"
#include "RedactionPipeline.h"
#include <vector>
#include <string>

class TerminalUI {
public:
    static void printDocumentSummary(const DocumentResult& result);
    static void printEntityTable(const std::vector<PiiEntity>& entities);
    static void printBatchSummary(size_t documents, size_t failed, size_t entities, double seconds);
};
