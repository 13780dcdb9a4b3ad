/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "commands.hpp"
#include "slurmplus/accounting.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace slurmplus::cli {

namespace {
std::string secondsSince(Timestamp now, Timestamp then) {
    return std::to_string(std::chrono::duration_cast<Duration>(now - then).count());
}

void emitStep(ColorIo& cio, const StepRecord& step, Timestamp now) {
    cio.print(Style::Highlight, "  step " + std::to_string(step.stepId()));
    cio.println(Style::Plain, " " + step.stepName());

    if (auto wallclock = step.wallclockDuration()) {
        cio.println(Style::Plain, "    wallclock runtime: " + std::to_string(wallclock->count()) + " s");
        cio.println(Style::Plain, "    exit code: " + std::to_string(step.exitCode().value_or(0)));
    } else if (auto started = step.startTime()) {
        cio.println(Style::Plain, "    step not yet finished; time since start: " + secondsSince(now, *started) + " s");
    } else {
        cio.println(Style::Plain, "    step not yet finished");
    }

    if (auto kib = step.maxVmSize()) {
        std::ostringstream text;
        text << std::fixed << std::setprecision(2) << (static_cast<double>(*kib) / 1024.0);
        cio.println(Style::Plain, "    max VM size: " + text.str() + " MiB");
    } else {
        cio.println(Style::Plain, "    max VM size not available (probably because step not finished)");
    }
}

void emitJob(ColorIo& cio, const JobRecord& job, Timestamp now) {
    cio.print(Style::Highlight, std::to_string(job.jobId()));
    cio.println(Style::Plain, " " + job.jobName());

    if (auto d = job.eligibleWaitDuration()) {
        cio.println(Style::Plain, "  time for job to become eligible to run: " + std::to_string(d->count()) + " s");
    } else {
        const Timestamp submitted = job.submitTime().value_or(now);
        cio.println(Style::Plain, "  job not yet eligible to run; time since submission: " + secondsSince(now, submitted) + " s");
        return;
    }

    if (auto d = job.startDelayAfterEligible()) {
        cio.println(Style::Plain, "  wait time after eligibility: " + std::to_string(d->count()) + " s");
    } else if (auto eligible = job.eligibleTime()) {
        cio.println(Style::Plain, "  job not yet started; time since eligibility: " + secondsSince(now, *eligible) + " s");
        return;
    }

    if (auto started = job.startTime()) {
        if (auto limit = job.timeLimit()) {
            const Timestamp deadline = *started + std::chrono::minutes(*limit);
            const auto remaining = std::chrono::duration_cast<std::chrono::minutes>(deadline - now).count();
            if (remaining > 0 && !job.endTime()) {
                cio.println(Style::Plain, "  time left until job hits time limit: " + std::to_string(remaining) + " min");
            }
        }
    }

    for (const StepRecord& step : job.steps().iter()) {
        emitStep(cio, step, now);
    }
}
}

int runStatus(ColorIo& cio, JobId jobId) {
    auto filters = JobFilters::create();
    filters->stepList().append(JobStepFilter::create(jobId));

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
            std::throw_with_nested(std::runtime_error("accounting query for job " + std::to_string(jobId) + " failed"));
        }
    }();

    if (jobs.empty()) {
        throw std::runtime_error("no accounting records for job " + std::to_string(jobId));
    }

    const auto now = std::chrono::system_clock::now();
    for (const JobRecord& job : jobs.iter()) {
        emitJob(cio, job, now);
    }
    return 0;
}

}
