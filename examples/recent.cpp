/*
 * slurmplus - List this user's jobs from the last week (recent)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slurmplus/accounting.hpp"
#include "slurmplus/error.hpp"
#include "slurmplus/logger.hpp"
#include "slurmplus/session.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace slurmplus;

int main() {
    if (!std::getenv("SLURMPLUS_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    try {
        Session session;

        const auto minStart = std::chrono::system_clock::now() - std::chrono::hours(24 * 7);

        auto filters = JobFilters::create();
        filters->useridList().append(CString::create(std::to_string(::getuid())));
        filters->setUsageStart(minStart);

        auto db = DatabaseConnection::open();
        auto jobs = db.getJobs(*filters);

        for (const JobRecord& job : jobs.iter()) {
            std::cout << job.jobId() << " " << job.jobName() << " " << shortcode(job.state()) << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "fatal error in recent\n";
        for (const auto& cause : describeErrorChain(e)) {
            std::cerr << "  caused by: " << cause << "\n";
        }
        return 1;
    }
}
