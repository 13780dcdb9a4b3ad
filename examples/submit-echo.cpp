/*
 * slurmplus - Submit a hello-world echo job (submit-echo)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slurmplus/error.hpp"
#include "slurmplus/job_descriptor.hpp"
#include "slurmplus/logger.hpp"
#include "slurmplus/session.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

using namespace slurmplus;

int main() {
    if (!std::getenv("SLURMPLUS_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    try {
        Session session;

        const std::string log = (std::filesystem::current_path() / "%j.log").string();

        auto desc = JobDescriptor::create();
        desc->setName("helloworld")
            .setArgv({"helloworld"})
            .inheritEnvironment()
            .setStderrPath(log)
            .setStdinPath("/dev/null")
            .setStdoutPath(log)
            .setWorkDirCwd()
            .setScript("#! /bin/bash\n"
                       "set -e -x\n"
                       "echo hello world\n")
            .setNumTasks(1)
            .setUidCurrent();

        auto response = desc->submitBatch();
        std::cout << "new job id: " << response->jobId() << "\n";

        if (auto error = response->error()) {
            std::cerr << "warning: controller also reported: " << error->what() << "\n";
        }
        if (auto message = response->userMessage()) {
            std::cout << *message << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "failed to submit job\n";
        for (const auto& cause : describeErrorChain(e)) {
            std::cerr << "  caused by: " << cause << "\n";
        }
        return 1;
    }
}
