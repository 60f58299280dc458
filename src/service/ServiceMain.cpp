#include "RedactionPipeline.h"
#include "RedactionService.h"
#include "RunConfig.h"
#include "VeilExceptions.h"
#include <iostream>
#include <string>

void printUsage(const std::string& prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --config <path>                  Load key: value settings (flags override them)\n"
              << "  --host <addr>                    Bind address (default: 0.0.0.0)\n"
              << "  --port <n>                       Listen port (default: 8080)\n"
              << "  --service-threads <n>            Request worker threads (default: 8)\n"
              << "  --marker <char>                  Default redaction marker (default: \xE2\x96\x88)\n"
              << "  --overlap-strategy <first_conflict|best_confidence>\n"
              << "  --line-offsets <first_occurrence|cumulative>\n"
              << "  --contextual-offsets <anchored|exact>\n"
              << "  --exclude-types <a,b,...>        Entity types to disable\n"
              << "  --help                           Show this help message\n";
}

int main(int argc, char* argv[]) {
    RunConfig config;
    try {
        config = RunConfig::fromArgs(argc, argv, false);
    } catch (const Veil::VeilException& e) {
        std::cerr << "[VeilService] " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    if (config.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    try {
        const RedactionPipeline pipeline(PipelineOptions::fromConfig(config));
        RequestMonitor monitor;
        RedactionService service(pipeline, monitor);
        return service.start(config.service);
    } catch (const Veil::VeilException& e) {
        std::cerr << "[VeilService] " << e.what() << "\n";
        return 1;
    }
}
