// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// main.cpp
// Command-line front end: resolves paths, runs one pipeline job.
// =================================================================
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "PipelineJob.h"
#include "TempMapConfig.h"

using namespace tempmap;

namespace {

    struct CliOptions {
        std::optional<std::string> dataFile;
        std::optional<std::string> templateFile;
        std::optional<std::string> outputDir;
        std::string configFile;
        bool quiet = false;
        bool help = false;
    };

    void printBanner() {
        std::cout << R"( _____                    __  __
|_   _|__ _ __ ___  _ __ |  \/  | __ _ _ __
  | |/ _ \ '_ ` _ \| '_ \| |\/| |/ _` | '_ \
  | |  __/ | | | | | |_) | |  | | (_| | |_) |
  |_|\___|_| |_| |_| .__/|_|  |_|\__,_| .__/
                   |_|                |_|
     Sensor log -> temperature heat map
================================================
)" << std::endl;
    }

    void printHelp() {
        std::cout <<
            "Usage: tempmap [options]\n"
            "  -d, --data PATH        sensor log (default data/data1.txt)\n"
            "  -t, --template PATH    channel layout workbook (default template/template.xlsx)\n"
            "  -o, --output DIR       output directory (default result)\n"
            "  -c, --config FILE      TempMapConfig.xml to load\n"
            "  -q, --quiet            suppress banner and progress\n"
            "  -h, --help             show this help\n"
            "Environment: TEMPMAP_CONFIG (config path), TEMPMAP_QUIET=1\n";
    }

    bool isQuietEnv() {
        const char* q = std::getenv("TEMPMAP_QUIET");
        return q && q[0] == '1';
    }

    // Returns false on a usage error, after reporting it.
    bool parseArgs(int argc, char* argv[], CliOptions& out) {
        for (int i = 1; i < argc; ++i) {
            const std::string a = argv[i];
            auto need = [&](std::string& value) -> bool {
                if (i + 1 >= argc) {
                    std::cerr << "[!] Missing value for " << a << "\n";
                    return false;
                }
                value = argv[++i];
                return true;
            };

            std::string value;
            if (a == "-d" || a == "--data") {
                if (!need(value)) return false;
                out.dataFile = value;
            }
            else if (a == "-t" || a == "--template") {
                if (!need(value)) return false;
                out.templateFile = value;
            }
            else if (a == "-o" || a == "--output") {
                if (!need(value)) return false;
                out.outputDir = value;
            }
            else if (a == "-c" || a == "--config") {
                if (!need(out.configFile)) return false;
            }
            else if (a == "-q" || a == "--quiet") out.quiet = true;
            else if (a == "-h" || a == "--help") out.help = true;
            else {
                std::cerr << "[!] Unknown argument: " << a << "\n";
                return false;
            }
        }
        return true;
    }

} // namespace

int main(int argc, char* argv[]) {
    CliOptions cli;
    if (!parseArgs(argc, argv, cli)) {
        printHelp();
        return 2;
    }
    if (cli.help) {
        printHelp();
        return 0;
    }

    ConfigState config;
    TempMapConfigNS::load_with_fallback(config, cli.configFile);

    // Command line wins over the config file.
    if (cli.dataFile) config.dataFile = *cli.dataFile;
    if (cli.templateFile) config.templateFile = *cli.templateFile;
    if (cli.outputDir) config.outputDir = *cli.outputDir;
    const bool quiet = cli.quiet || config.quiet || isQuietEnv();

    if (!quiet) {
        printBanner();
        if (!config.loadedFrom.empty()) {
            std::cout << "[*] Config loaded from: " << config.loadedFrom << "\n";
        }
        std::cout << "[*] Data:     " << config.dataFile << "\n"
                  << "[*] Template: " << config.templateFile << "\n"
                  << "[*] Output:   " << config.outputDir << std::endl;
    }

    PipelineJob job;
    job.start(PipelineRequest{ config.dataFile, config.templateFile, config.outputDir });

    auto printEvent = [quiet](const ProgressEvent& event) {
        if (!quiet) std::cout << event.message << std::endl;
    };
    while (!job.isDone()) {
        job.drain(printEvent);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    job.drain(printEvent);

    const PipelineResult result = job.wait();
    if (!result) {
        std::cerr << "[!] " << result.error().describe() << std::endl;
        return 1;
    }
    std::cout << "[+] Result written to " << result->string() << std::endl;
    return 0;
}
