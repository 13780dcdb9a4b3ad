/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "commands.hpp"
#include "slurmplus/accounting.hpp"
#include "slurmplus/logger.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <unistd.h>

namespace slurmplus::cli {

namespace {

// Array jobs are reported as one group under the array's id.
JobId groupId(const JobRecord& job) {
    return job.arrayJobId().value_or(job.jobId());
}

struct JobGroup {
    JobId id = 0;
    std::string name;
    Timestamp submitTime;
    std::string submitText;
    std::size_t jobCount = 0;
    std::map<JobState, std::size_t> states;

    JobGroup(const JobRecord& job, Timestamp now)
        : id(groupId(job)),
          name(job.jobName()),
          submitTime(job.submitTime().value_or(now)) {
        submitText = durationToText(std::chrono::duration_cast<Duration>(now - submitTime));
    }

    void accumulate(const JobRecord& job) {
        ++jobCount;
        ++states[job.state()];
    }

    void emit(ColorIo& cio, std::size_t nameWidth, std::size_t timeWidth) const {
        cio.print(Style::Highlight, std::to_string(id));

        std::ostringstream row;
        row << " " << std::left << std::setw(static_cast<int>(nameWidth)) << name;
        row << "  " << std::left << std::setw(static_cast<int>(timeWidth + 4)) << (submitText + " ago") << " ";
        cio.print(Style::Plain, row.str());

        if (jobCount == 1) {
            cio.print(Style::Plain, " ");
            printState(cio, states.begin()->first);
            cio.println(Style::Plain, "");
            return;
        }

        bool first = true;
        for (const auto& [state, count] : states) {
            if (!first) {
                cio.print(Style::Plain, ",");
            }
            first = false;
            cio.print(Style::Plain, " " + std::to_string(count) + " ");
            printState(cio, state);
        }
        cio.println(Style::Plain, " (" + std::to_string(jobCount) + " total)");
    }
};

}

int runRecent(ColorIo& cio, const RecentOptions& options) {
    const auto now = std::chrono::system_clock::now();
    const auto minStart = now - std::chrono::hours(24) * options.spanDays;

    // The accounting database matches uids given as decimal text.
    auto filters = JobFilters::create();
    filters->useridList().append(CString::create(std::to_string(::getuid())));
    filters->setUsageStart(minStart);

    LOG_DEBUG("Querying jobs of the last " + std::to_string(options.spanDays) + " days");

    auto db = [] {
        try {
            return DatabaseConnection::open();
        } catch (const std::exception&) {
            std::throw_with_nested(std::runtime_error("cannot connect to the Slurm accounting database"));
        }
    }();

    auto jobs = [&] {
        try {
            return db.getJobs(*filters);
        } catch (const std::exception&) {
            std::throw_with_nested(std::runtime_error("accounting query for recent jobs failed"));
        }
    }();

    std::unordered_map<JobId, JobGroup> groups;
    std::size_t nameWidth = 0;
    std::size_t timeWidth = 0;

    for (const JobRecord& job : jobs.iter()) {
        auto it = groups.find(groupId(job));
        if (it == groups.end()) {
            JobGroup group(job, now);
            nameWidth = std::max(nameWidth, group.name.size());
            timeWidth = std::max(timeWidth, group.submitText.size());
            it = groups.emplace(group.id, std::move(group)).first;
        }
        it->second.accumulate(job);
    }

    std::vector<const JobGroup*> ordered;
    ordered.reserve(groups.size());
    for (const auto& entry : groups) {
        ordered.push_back(&entry.second);
    }
    std::sort(ordered.begin(), ordered.end(), [](const JobGroup* a, const JobGroup* b) {
        return a->submitTime < b->submitTime;
    });

    const std::size_t skip = ordered.size() > options.limit ? ordered.size() - options.limit : 0;
    for (std::size_t i = skip; i < ordered.size(); ++i) {
        ordered[i]->emit(cio, nameWidth, timeWidth);
    }
    return 0;
}

}
