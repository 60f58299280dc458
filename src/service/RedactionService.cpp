#include "RedactionService.h"

#include "CommonUtils.h"
#include "JsonUtils.h"
#include "VeilExceptions.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
using Clock = std::chrono::steady_clock;
using JsonUtils::JsonValue;

constexpr const char* kRedactEndpoint = "/redact";
constexpr const char* kBatchEndpoint = "/batch_redact";

std::string formatDouble(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream out;
    out << std::setprecision(15) << value;
    return out.str();
}

long long toLatencyMicros(double latencyMs) {
    if (!std::isfinite(latencyMs) || latencyMs <= 0.0) return 0;
    return static_cast<long long>(std::llround(latencyMs * 1000.0));
}

double elapsedMs(Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

JsonValue parseRequestObject(const std::string& body) {
    const JsonValue payload = JsonUtils::parse(body);
    if (!payload.isObject()) {
        throw Veil::ConfigurationException("Request body must be a JSON object");
    }
    return payload;
}

std::string requiredString(const JsonValue& object, const std::string& key, const std::string& label) {
    const JsonValue* node = object.find(key);
    if (node == nullptr || !node->isString()) {
        throw Veil::ConfigurationException(label + " requires string field '" + key + "'");
    }
    return node->stringValue;
}

std::string optionalString(const JsonValue& object, const std::string& key, const std::string& fallback) {
    const JsonValue* node = object.find(key);
    if (node == nullptr || node->type == JsonValue::Type::Null) return fallback;
    if (!node->isString()) {
        throw Veil::ConfigurationException("'" + key + "' must be a string");
    }
    return node->stringValue;
}

std::string markerFromRequest(const JsonValue& request, const std::string& fallback) {
    const std::string marker = optionalString(request, "marker", fallback);
    if (CommonUtils::utf8Length(marker) != 1 || marker == "\n" || marker == "\r") {
        throw Veil::ConfigurationException("'marker' must be exactly one non-newline character");
    }
    return marker;
}

std::string serializeDocument(const DocumentResult& result) {
    std::vector<PiiEntity> entities = result.entities;
    std::stable_sort(entities.begin(), entities.end(), [](const PiiEntity& a, const PiiEntity& b) {
        return a.startPos < b.startPos;
    });

    std::ostringstream out;
    out << "{"
        << "\"name\":\"" << JsonUtils::escapeJsonString(result.name) << "\","
        << "\"redacted_text\":\"" << JsonUtils::escapeJsonString(result.redactedText) << "\","
        << "\"entities\":[";
    for (size_t i = 0; i < entities.size(); ++i) {
        const auto& e = entities[i];
        if (i > 0) out << ',';
        out << "{"
            << "\"text\":\"" << JsonUtils::escapeJsonString(e.text) << "\","
            << "\"type\":\"" << JsonUtils::escapeJsonString(e.entityType) << "\","
            << "\"start\":" << e.startPos << ","
            << "\"end\":" << e.endPos << ","
            << "\"confidence\":" << formatDouble(e.confidence)
            << "}";
    }
    out << "],"
        << "\"pii_entities_found\":" << result.piiEntitiesFound << ","
        << "\"original_length\":" << result.originalLength << ","
        << "\"redacted_length\":" << result.redactedLength << ","
        << "\"characters_redacted\":" << result.charactersRedacted
        << "}";
    return out.str();
}

// Appends latency and monitoring members to a serialized JSON object.
std::string withMonitoring(std::string object, double latencyMs, uint64_t totalRequests) {
    object.pop_back();
    object += ",\"latency_ms\":" + formatDouble(latencyMs) +
              ",\"monitoring\":{\"total_requests\":" + std::to_string(totalRequests) + "}}";
    return object;
}

std::string makeBatchSuccessResponse(const std::vector<DocumentResult>& results) {
    std::ostringstream out;
    out << "{\"count\":" << results.size() << ",\"results\":[";
    for (size_t i = 0; i < results.size(); ++i) {
        if (i > 0) out << ',';
        out << serializeDocument(results[i]);
    }
    out << "]}";
    return out.str();
}

std::string makeErrorResponse(const std::string& error, double latencyMs) {
    std::ostringstream out;
    out << "{"
        << "\"error\":\"" << JsonUtils::escapeJsonString(error) << "\","
        << "\"latency_ms\":" << formatDouble(latencyMs)
        << "}";
    return out.str();
}

void logMonitoringLine(const std::string& endpoint, double latencyMs, const MonitoringSnapshot& snapshot) {
    std::ostringstream line;
    line << "[VeilService][Monitor] endpoint=" << endpoint
         << " total_requests=" << snapshot.totalRequests
         << " errors=" << snapshot.errorRequests
         << " latency_ms=" << latencyMs
         << " avg_latency_ms=" << snapshot.averageLatencyMs
         << " documents=" << snapshot.totalDocuments
         << " entities=" << snapshot.totalEntities;
    std::cout << line.str() << "\n";
}
} // namespace

void RequestMonitor::countEndpoint(const std::string& endpoint, double latencyMs) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    if (endpoint == kRedactEndpoint) {
        redactRequests.fetch_add(1, std::memory_order_relaxed);
    } else if (endpoint == kBatchEndpoint) {
        batchRequests.fetch_add(1, std::memory_order_relaxed);
    }
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
}

void RequestMonitor::recordSuccess(const std::string& endpoint,
                                   double latencyMs,
                                   const std::vector<DocumentResult>& documents) {
    countEndpoint(endpoint, latencyMs);
    totalDocuments.fetch_add(static_cast<uint64_t>(documents.size()), std::memory_order_relaxed);

    uint64_t entities = 0;
    for (const auto& doc : documents) {
        entities += static_cast<uint64_t>(doc.piiEntitiesFound);
    }
    totalEntities.fetch_add(entities, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(typeMutex);
    for (const auto& doc : documents) {
        for (const auto& entry : doc.countsByType) {
            entitiesByType[entry.first] += static_cast<uint64_t>(entry.second);
        }
    }
}

void RequestMonitor::recordError(const std::string& endpoint, double latencyMs) {
    countEndpoint(endpoint, latencyMs);
    errorRequests.fetch_add(1, std::memory_order_relaxed);
}

MonitoringSnapshot RequestMonitor::snapshot() const {
    MonitoringSnapshot out;
    out.totalRequests = totalRequests.load(std::memory_order_relaxed);
    out.redactRequests = redactRequests.load(std::memory_order_relaxed);
    out.batchRequests = batchRequests.load(std::memory_order_relaxed);
    out.errorRequests = errorRequests.load(std::memory_order_relaxed);
    out.totalDocuments = totalDocuments.load(std::memory_order_relaxed);
    out.totalEntities = totalEntities.load(std::memory_order_relaxed);

    const uint64_t latencyMicros = totalLatencyMicros.load(std::memory_order_relaxed);
    if (out.totalRequests > 0) {
        out.averageLatencyMs = static_cast<double>(latencyMicros) / static_cast<double>(out.totalRequests) / 1000.0;
    }

    std::lock_guard<std::mutex> lock(typeMutex);
    out.entitiesByType = entitiesByType;
    return out;
}

RedactionService::RedactionService(const RedactionPipeline& pipelineRef, RequestMonitor& monitorRef)
    : pipeline(pipelineRef), monitor(monitorRef) {}

ServiceResponse RedactionService::handleRedact(const std::string& body) {
    const auto started = Clock::now();
    try {
        const JsonValue payload = parseRequestObject(body);
        const std::string text = requiredString(payload, "text", "Request");
        const std::string name = optionalString(payload, "name", "document");
        const std::string marker = markerFromRequest(payload, pipeline.options().marker);

        const DocumentResult result = pipeline.processText(text, name, marker);

        const double latencyMs = elapsedMs(started);
        monitor.recordSuccess(kRedactEndpoint, latencyMs, {result});
        const MonitoringSnapshot snapshot = monitor.snapshot();
        logMonitoringLine(kRedactEndpoint, latencyMs, snapshot);
        return {200, withMonitoring(serializeDocument(result), latencyMs, snapshot.totalRequests)};
    } catch (const std::exception& e) {
        const double latencyMs = elapsedMs(started);
        monitor.recordError(kRedactEndpoint, latencyMs);
        logMonitoringLine(kRedactEndpoint, latencyMs, monitor.snapshot());
        return {400, makeErrorResponse(e.what(), latencyMs)};
    }
}

ServiceResponse RedactionService::handleBatchRedact(const std::string& body) {
    const auto started = Clock::now();
    try {
        const JsonValue payload = parseRequestObject(body);
        const JsonValue* documentsNode = payload.find("documents");
        if (documentsNode == nullptr || !documentsNode->isArray()) {
            throw Veil::ConfigurationException("Request requires 'documents' array");
        }
        const std::string marker = markerFromRequest(payload, pipeline.options().marker);

        std::vector<DocumentResult> results;
        results.reserve(documentsNode->arrayValue.size());
        for (size_t i = 0; i < documentsNode->arrayValue.size(); ++i) {
            const JsonValue& item = documentsNode->arrayValue[i];
            const std::string label = "documents[" + std::to_string(i) + "]";
            if (!item.isObject()) {
                throw Veil::ConfigurationException(label + " must be an object");
            }
            const std::string text = requiredString(item, "text", label);
            const std::string name = optionalString(item, "name", "document_" + std::to_string(i + 1));
            results.push_back(pipeline.processText(text, name, marker));
        }

        const double latencyMs = elapsedMs(started);
        monitor.recordSuccess(kBatchEndpoint, latencyMs, results);
        const MonitoringSnapshot snapshot = monitor.snapshot();
        logMonitoringLine(kBatchEndpoint, latencyMs, snapshot);
        return {200, withMonitoring(makeBatchSuccessResponse(results), latencyMs, snapshot.totalRequests)};
    } catch (const std::exception& e) {
        const double latencyMs = elapsedMs(started);
        monitor.recordError(kBatchEndpoint, latencyMs);
        logMonitoringLine(kBatchEndpoint, latencyMs, monitor.snapshot());
        return {400, makeErrorResponse(e.what(), latencyMs)};
    }
}
