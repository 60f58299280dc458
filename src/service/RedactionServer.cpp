#include "RedactionService.h"

#include <algorithm>
#include <iostream>

#include <httplib.h>

namespace {
void setJsonResponse(httplib::Response& response, const ServiceResponse& result) {
    response.status = result.status;
    response.set_content(result.body, "application/json");
}
} // namespace

int RedactionService::start(const ServiceConfig& config) {
    httplib::Server server;
    server.new_task_queue = [threadCount = std::max<size_t>(1, config.threadCount)] {
        return new httplib::ThreadPool(threadCount);
    };

    server.Post("/redact", [this](const httplib::Request& request, httplib::Response& response) {
        setJsonResponse(response, handleRedact(request.body));
    });

    server.Post("/batch_redact", [this](const httplib::Request& request, httplib::Response& response) {
        setJsonResponse(response, handleBatchRedact(request.body));
    });

    const PatternCatalog& catalog = pipeline.detector().catalog();
    std::cout << "[VeilService] host=" << config.host
              << " port=" << config.port
              << " threads=" << std::max<size_t>(1, config.threadCount)
              << " structural_rules=" << catalog.structuralRules().size()
              << " heuristic_rules=" << catalog.heuristicRules().size()
              << " keywords=" << catalog.contextualKeywords().size()
              << "\n";

    if (!server.listen(config.host.c_str(), config.port)) {
        std::cerr << "[VeilService] failed_to_bind host=" << config.host << " port=" << config.port << "\n";
        return 1;
    }

    return 0;
}
