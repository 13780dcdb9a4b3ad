/*
 * slurmplus - Better commands for interacting with Slurm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "colorio.hpp"
#include "commands.hpp"
#include "slurmplus/config.hpp"
#include "slurmplus/logger.hpp"
#include "slurmplus/session.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace slurmplus;

constexpr const char* VERSION = "0.1.3";

void printUsage(const char* progName) {
    std::cout << "slurmplus v" << VERSION << " - better commands for interacting with Slurm\n\n";
    std::cout << "Usage: " << progName << " recent [-s|--span DAYS] [-l|--limit N]\n";
    std::cout << "       " << progName << " status <jobid>\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Commands:\n";
    std::cout << "  recent        Summarize recently-run jobs of the current user\n";
    std::cout << "  status        Get the status of a job (running or completed)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -s, --span DAYS   How many days back to query the accounting database (default 7)\n";
    std::cout << "  -l, --limit N     Show at most this many recent jobs (default 30)\n";
    std::cout << "  --color MODE      auto, always or never\n";
    std::cout << "  -h, --help        Show this help message\n";
    std::cout << "  -v, --version     Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SLURMPLUS_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  SLURMPLUS_SPAN_DAYS    Default for --span\n";
    std::cout << "  SLURMPLUS_LIMIT        Default for --limit\n";
    std::cout << "  SLURMPLUS_COLOR        Default for --color\n";
    std::cout << "  SLURMPLUS_SLURM_CONF   slurm.conf to load instead of the default\n";
}

namespace {
unsigned long parseNumber(const std::string& text, const std::string& what) {
    std::size_t used = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &used);
    } catch (const std::exception&) {
        std::throw_with_nested(std::runtime_error("invalid " + what + " '" + text + "'"));
    }
    if (used != text.size() || text.front() == '-') {
        throw std::runtime_error("invalid " + what + " '" + text + "'");
    }
    return value;
}

JobId parseJobId(const std::string& text) {
    unsigned long value = parseNumber(text, "job id");
    if (value == 0 || value > 0xFFFFFFFFul) {
        throw std::runtime_error("invalid job id '" + text + "'");
    }
    return static_cast<JobId>(value);
}
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean output; SLURMPLUS_LOG_LEVEL overrides
    if (!std::getenv("SLURMPLUS_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    Config config = Config::fromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    // --color is needed before anything is printed
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--color") {
            if (auto mode = parseColorMode(argv[i + 1])) {
                config.color = *mode;
            } else {
                std::cerr << "Error: --color expects auto, always or never\n";
                return 1;
            }
        }
    }

    cli::ColorIo cio(config.color);
    const std::string command = argv[1];

    try {
        if (command == "recent") {
            cli::RecentOptions options;
            options.spanDays = config.spanDays;
            options.limit = config.limit;

            for (int i = 2; i < argc; ++i) {
                std::string arg = argv[i];
                if ((arg == "-s" || arg == "--span") && i + 1 < argc) {
                    const std::string value = argv[++i];
                    auto days = parseSpanDays(value);
                    if (!days) {
                        throw std::runtime_error("invalid span '" + value + "' (expected 1 to " +
                                                 std::to_string(MAX_SPAN_DAYS) + " days)");
                    }
                    options.spanDays = *days;
                } else if ((arg == "-l" || arg == "--limit") && i + 1 < argc) {
                    const std::string value = argv[++i];
                    auto limit = parseLimit(value);
                    if (!limit) {
                        throw std::runtime_error("invalid limit '" + value + "'");
                    }
                    options.limit = *limit;
                } else if (arg == "--color" && i + 1 < argc) {
                    ++i;
                } else {
                    throw std::runtime_error("unexpected argument to recent: '" + arg + "'");
                }
            }

            Session session(config.slurmConf);
            return cli::runRecent(cio, options);
        }

        if (command == "status") {
            std::string jobArg;
            for (int i = 2; i < argc; ++i) {
                std::string arg = argv[i];
                if (arg == "--color" && i + 1 < argc) {
                    ++i;
                } else if (jobArg.empty()) {
                    jobArg = arg;
                } else {
                    throw std::runtime_error("unexpected argument to status: '" + arg + "'");
                }
            }
            if (jobArg.empty()) {
                throw std::runtime_error("status requires a job id");
            }

            const JobId jobId = parseJobId(jobArg);
            Session session(config.slurmConf);
            return cli::runStatus(cio, jobId);
        }

        std::cerr << "Error: unknown command '" << command << "'\n\n";
        printUsage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        cio.printErrorChain(e);
        return 1;
    }
}
