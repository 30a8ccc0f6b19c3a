/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/config.hpp"
#include "snapmx/logger.hpp"
#include "snapmx/matrix.hpp"
#include "snapmx/plan.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace snapmx;

namespace {

struct CliOptions {
    std::string command;
    std::filesystem::path configPath;
    PlanOptions plan;
    std::optional<int> basePort;
    std::string format = "github";
    std::optional<std::string> group;
    bool verbose = false;
};

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto begin = item.find_first_not_of(" \t");
        auto end = item.find_last_not_of(" \t");
        if (begin != std::string::npos) {
            items.push_back(item.substr(begin, end - begin + 1));
        }
    }
    return items;
}

void printUsage(const char* progName) {
    std::cout << "snapmx Device Screenshot Matrix Runner v" << kVersion << "\n\n";
    std::cout << "Usage: " << progName << " validate --config <file>\n";
    std::cout << "       " << progName << " plan --config <file> [options]\n";
    std::cout << "       " << progName << " matrix --config <file> [--format github|gitlab|azure] [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Commands:\n";
    std::cout << "  validate      Check a configuration file and print its contents\n";
    std::cout << "  plan          Print the job matrix without running it\n";
    std::cout << "  matrix        Print a CI matrix as JSON on stdout\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>       Configuration JSON (required)\n";
    std::cout << "  --platforms <list>    Comma-separated platforms (ios,android)\n";
    std::cout << "  --devices <list>      Comma-separated device names or folders\n";
    std::cout << "  --langs <list>        Comma-separated languages\n";
    std::cout << "  --screens <list>      Comma-separated screenshot names\n";
    std::cout << "  --output <dir>        Output root (default: ./Screenshots)\n";
    std::cout << "  --base-port <port>    Override ports.base_port\n";
    std::cout << "  --ios-app <path>      Use this iOS app instead of the configured artifact\n";
    std::cout << "  --android-app <path>  Use this APK instead of the configured artifact\n";
    std::cout << "  --format <name>       Matrix format (default: github)\n";
    std::cout << "  --group <key>         Matrix records grouped by platform|device|language\n";
    std::cout << "  --verbose             Debug logging\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "  -v, --version         Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SNAPMX_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " validate --config snapmx.json\n";
    std::cout << "  " << progName << " plan --config snapmx.json --langs en,de\n";
    std::cout << "  " << progName << " matrix --config snapmx.json --platforms ios --format gitlab\n";
}

// Returns an error message, or empty on success.
std::string parseArgs(int argc, char* argv[], CliOptions& options) {
    if (argc < 2) {
        return "Missing command";
    }
    options.command = argv[1];
    if (options.command != "validate" && options.command != "plan" && options.command != "matrix") {
        return "Unknown command: " + options.command;
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) -> bool {
            if (i + 1 >= argc) {
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            return "Unexpected argument: " + arg;
        }
        if (!next(value)) {
            return arg + " requires a value";
        }

        if (arg == "--config") {
            options.configPath = value;
        } else if (arg == "--platforms") {
            options.plan.filters.platforms = splitList(value);
        } else if (arg == "--devices") {
            options.plan.filters.devices = splitList(value);
        } else if (arg == "--langs") {
            options.plan.filters.languages = splitList(value);
        } else if (arg == "--screens") {
            options.plan.filters.screenshots = splitList(value);
        } else if (arg == "--output") {
            options.plan.outputRoot = value;
        } else if (arg == "--base-port") {
            try {
                options.basePort = std::stoi(value);
            } catch (const std::exception&) {
                return "Invalid --base-port: " + value;
            }
        } else if (arg == "--ios-app") {
            options.plan.iosAppOverride = std::filesystem::path(value);
        } else if (arg == "--android-app") {
            options.plan.androidAppOverride = std::filesystem::path(value);
        } else if (arg == "--format") {
            options.format = value;
        } else if (arg == "--group") {
            options.group = value;
        } else {
            return "Unknown option: " + arg;
        }
    }

    if (options.configPath.empty()) {
        return "--config is required";
    }
    return "";
}

int validateConfig(const CliOptions& options) {
    auto loaded = loadConfig(options.configPath);
    if (!loaded) {
        std::cerr << "Invalid configuration [" << configErrorName(loaded.error) << "]: "
                  << loaded.message << "\n";
        return 1;
    }

    auto issues = checkConfig(loaded.config);
    if (!issues.empty()) {
        std::cerr << "Configuration has " << issues.size() << " problem(s):\n";
        for (const auto& issue : issues) {
            std::cerr << "  - " << issue << "\n";
        }
        return 1;
    }

    std::cout << "Configuration is valid: " << options.configPath.string() << "\n";
    std::cout << describeConfig(loaded.config);
    return 0;
}

int printMatrix(const RunPlan& plan, const CliOptions& options) {
    if (options.group) {
        auto key = parseMatrixGroup(*options.group);
        if (!key) {
            std::cerr << "Error: Unknown group key: " << *options.group << "\n";
            return 1;
        }
        nlohmann::json grouped = nlohmann::json::object();
        for (const auto& [name, records] : groupMatrix(plan, *key)) {
            nlohmann::json list = nlohmann::json::array();
            for (const auto& r : records) {
                list.push_back({
                    {"id", r.id},
                    {"platform", r.platform},
                    {"device", r.device},
                    {"folder", r.folder},
                    {"language", r.language},
                    {"screenshots", r.screenshots},
                    {"output_dir", r.outputDir},
                    {"ports", r.ports.ports()}
                });
            }
            grouped[name] = list;
        }
        std::cout << grouped.dump(2) << std::endl;
        return 0;
    }

    auto format = parseMatrixFormat(options.format);
    if (!format) {
        std::cerr << "Error: Unknown format: " << options.format << " (expected github, gitlab or azure)\n";
        return 1;
    }
    std::cout << renderMatrix(plan, *format).dump(2) << std::endl;
    LOG_INFO("Generated " + options.format + " matrix with " + std::to_string(plan.jobs.size()) + " jobs");
    return 0;
}

}

int main(int argc, char* argv[]) {
    setThreadName("Main");

    // Handle --help and --version before anything else
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << kVersion << "\n";
            return 0;
        }
    }

    CliOptions options;
    std::string error = parseArgs(argc, argv, options);
    if (!error.empty()) {
        std::cerr << "Error: " << error << "\n\n";
        printUsage(argv[0]);
        return 1;
    }

    if (options.verbose) {
        Logger::setLevel(LogLevel::DEBUG);
    } else {
        Logger::initFromEnv();
    }

    try {
        if (options.command == "validate") {
            return validateConfig(options);
        }

        auto loaded = loadConfig(options.configPath);
        if (!loaded) {
            std::cerr << "Error: " << loaded.message << "\n";
            return 1;
        }
        Config& config = loaded.config;
        if (options.basePort) {
            config.ports.basePort = *options.basePort;
        }

        // Dry runs describe the matrix even before apps are built
        options.plan.requireArtifacts = false;
        auto planned = buildPlan(config, options.plan);
        if (!planned) {
            std::cerr << "Error: " << planned.message << "\n";
            return 1;
        }

        if (options.command == "matrix") {
            return printMatrix(planned.plan, options);
        }

        std::cout << describePlan(planned.plan);
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
