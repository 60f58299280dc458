#pragma once

#include "RedactionPipeline.h"
#include "RunConfig.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

struct MonitoringSnapshot {
    uint64_t totalRequests = 0;
    uint64_t redactRequests = 0;
    uint64_t batchRequests = 0;
    uint64_t errorRequests = 0;
    uint64_t totalDocuments = 0;
    uint64_t totalEntities = 0;
    double averageLatencyMs = 0.0;
    std::map<std::string, uint64_t> entitiesByType;
};

class RequestMonitor {
public:
    void recordSuccess(const std::string& endpoint,
                       double latencyMs,
                       const std::vector<DocumentResult>& documents);
    void recordError(const std::string& endpoint, double latencyMs);
    MonitoringSnapshot snapshot() const;

private:
    void countEndpoint(const std::string& endpoint, double latencyMs);

    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> redactRequests{0};
    std::atomic<uint64_t> batchRequests{0};
    std::atomic<uint64_t> errorRequests{0};
    std::atomic<uint64_t> totalDocuments{0};
    std::atomic<uint64_t> totalEntities{0};
    std::atomic<uint64_t> totalLatencyMicros{0};

    mutable std::mutex typeMutex;
    std::map<std::string, uint64_t> entitiesByType;
};

struct ServiceResponse {
    int status = 200;
    std::string body;
};

class RedactionService {
public:
    RedactionService(const RedactionPipeline& pipeline, RequestMonitor& monitor);

    /**
     * @brief Handles a POST /redact body: {"text": "...", "marker"?: "*", "name"?: "..."}.
     * @post status 200 with the document JSON, or 400 with {"error","latency_ms"}.
     */
    ServiceResponse handleRedact(const std::string& body);

    // POST /batch_redact body: {"documents": [{"text","name"}...], "marker"?}.
    ServiceResponse handleBatchRedact(const std::string& body);

    /**
     * @brief Serves both endpoints on the cpp-httplib thread pool until the
     * listener stops.
     * @return 0 on clean shutdown, 1 when the address cannot be bound.
     */
    int start(const ServiceConfig& config);

private:
    const RedactionPipeline& pipeline;
    RequestMonitor& monitor;
};
