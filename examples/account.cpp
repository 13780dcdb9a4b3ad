/*
 * slurmplus - Query the accounting database about one job (account)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slurmplus/accounting.hpp"
#include "slurmplus/error.hpp"
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
        std::cerr << "Print accounting information about one job.\n";
        return 1;
    }

    try {
        const JobId jobId = static_cast<JobId>(std::stoul(argv[1]));
        Session session;

        auto filters = JobFilters::create();
        filters->stepList().append(JobStepFilter::create(jobId));

        auto db = DatabaseConnection::open();
        auto jobs = db.getJobs(*filters);

        for (const JobRecord& job : jobs.iter()) {
            std::cout << job.jobId() << " " << job.jobName() << "\n";

            if (auto d = job.waitDuration()) {
                std::cout << "  wait time: " << d->count() << " s\n";
            } else {
                std::cout << "  still waiting to start\n";
            }

            if (auto d = job.wallclockDuration()) {
                std::cout << "  wallclock runtime: " << d->count() << " s\n";
                std::cout << "  exit code: " << job.exitCode().value_or(0) << "\n";
            } else {
                std::cout << "  job has not yet finished\n";
            }
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "fatal error in account\n";
        for (const auto& cause : describeErrorChain(e)) {
            std::cerr << "  caused by: " << cause << "\n";
        }
        return 1;
    }
}
