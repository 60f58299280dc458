#include "RedactionPipeline.h"
#include "RunConfig.h"
#include "VeilExceptions.h"
#include <iostream>
#include <string>

void printUsage(const std::string& prog) {
    std::cout << "Usage: " << prog << " <file> [file...] [options]\n"
              << "Options:\n"
              << "  --config <path>                  Load key: value settings (flags override them)\n"
              << "  --output-dir, -o <dir>           Where redacted files and reports are written (default: .)\n"
              << "  --marker <char>                  Redaction marker, one character (default: \xE2\x96\x88)\n"
              << "  --delimiter <char>               Delimiter for .csv inputs (default: ,)\n"
              << "  --report <txt|md|both|none>      Report files to write (default: txt)\n"
              << "  --overlap-strategy <first_conflict|best_confidence>\n"
              << "                                   Overlap resolution (default: first_conflict)\n"
              << "  --line-offsets <first_occurrence|cumulative>\n"
              << "                                   Keyword pass line offsets (default: first_occurrence)\n"
              << "  --contextual-offsets <anchored|exact>\n"
              << "                                   Keyword capture span start (default: anchored)\n"
              << "  --exclude-types <a,b,...>        Entity types to disable (e.g. zip_code,builtin_country)\n"
              << "  --threads <n>                    Worker threads for batches, 0 = runtime default\n"
              << "  --print-entities                 Print each document's entity table\n"
              << "  --verbose                        Enable detailed logs\n"
              << "  --help                           Show this help message\n";
}

int main(int argc, char* argv[]) {
    RunConfig config;
    try {
        config = RunConfig::fromArgs(argc, argv);
    } catch (const Veil::VeilException& e) {
        std::cerr << "[Veil Error] " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    if (config.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    try {
        return RedactionPipeline::run(config);
    } catch (const Veil::VeilException& e) {
        std::cerr << "[Veil Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Veil Exception] " << e.what() << "\n";
        return 1;
    }
}
