/*
 * slurmplus - Print information about one job (rsinfo)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slurmplus/error.hpp"
#include "slurmplus/job_info.hpp"
#include "slurmplus/logger.hpp"
#include "slurmplus/session.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

using namespace slurmplus;

int main(int argc, char* argv[]) {
    if (!std::getenv("SLURMPLUS_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <jobid>\n";
        std::cerr << "Print information about one job.\n";
        return 1;
    }

    try {
        const JobId jobId = static_cast<JobId>(std::stoul(argv[1]));
        Session session;

        SingleJobInfo info = getJobInfo(jobId);
        std::cout << "Job ID: " << info->jobId() << "\n";
        std::cout << "Name: " << info->name() << "\n";
        std::cout << "Partition: " << info->partition() << "\n";
        std::cout << "State: " << toString(info->state()) << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "fatal error in rsinfo\n";
        for (const auto& cause : describeErrorChain(e)) {
            std::cerr << "  caused by: " << cause << "\n";
        }
        return 1;
    }
}
