/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slurmplus/accounting.hpp"
#include "slurmplus/error.hpp"
#include "slurmplus/features.hpp"
#include "slurmplus/logger.hpp"
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>

namespace slurmplus {

namespace {
// TRES_VMEM in Slurm's TRES numbering.
constexpr int VMEM_TRES_ID = 7;

std::time_t toRaw(Timestamp t) noexcept {
    return std::chrono::system_clock::to_time_t(t);
}
}

std::optional<std::uint64_t> parseTresValue(const char* tres, int id) noexcept {
    if (!tres) {
        return std::nullopt;
    }

    const char* p = tres;
    while (*p) {
        char* end = nullptr;
        errno = 0;
        long entryId = std::strtol(p, &end, 10);
        if (end == p || *end != '=') {
            return std::nullopt;
        }
        p = end + 1;

        unsigned long long value = std::strtoull(p, &end, 10);
        if (end == p || errno == ERANGE) {
            return std::nullopt;
        }
        if (entryId == id) {
            return optionalValue64(static_cast<std::uint64_t>(value));
        }

        p = end;
        if (*p == ',') {
            ++p;
        } else if (*p) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

StepId StepRecord::stepId() const noexcept {
#if SLURMPLUS_HAVE_STEP_REC_STEP_ID
    return get().step_id.step_id;
#else
    return get().stepid;
#endif
}

std::optional<std::uint64_t> StepRecord::maxVmSize() const noexcept {
    if (!endTime()) {
        return std::nullopt;
    }
#if SLURMPLUS_HAVE_STATS_VSIZE_MAX
    return optionalValue64(get().stats.vsize_max);
#else
    // Newer Slurm only keeps TRES usage strings, in bytes.
    auto bytes = parseTresValue(get().stats.tres_usage_in_max, VMEM_TRES_ID);
    if (!bytes) {
        return std::nullopt;
    }
    return *bytes / 1024;
#endif
}

Owned<JobStepFilter> JobStepFilter::create(JobId jobId) {
    auto filter = Owned<JobStepFilter>::allocZeroed();
    slurmdb_selected_step_t& step = *filter.raw();

    step.array_task_id = NO_VAL;
#if SLURMPLUS_HAVE_SELECTED_STEP_STEP_ID
    step.step_id.job_id = jobId;
    step.step_id.step_id = NO_VAL;
    step.step_id.step_het_comp = NO_VAL;
#else
    step.jobid = jobId;
    step.stepid = NO_VAL;
#endif
#if SLURMPLUS_HAVE_SELECTED_STEP_PACK_JOB_OFFSET
    step.pack_job_offset = NO_VAL;
#endif
#if SLURMPLUS_HAVE_SELECTED_STEP_HET_JOB_OFFSET
    step.het_job_offset = NO_VAL;
#endif
    return filter;
}

JobId JobStepFilter::jobId() const noexcept {
#if SLURMPLUS_HAVE_SELECTED_STEP_STEP_ID
    return get().step_id.job_id;
#else
    return get().jobid;
#endif
}

std::optional<StepId> JobStepFilter::stepId() const noexcept {
#if SLURMPLUS_HAVE_SELECTED_STEP_STEP_ID
    return optionalValue(get().step_id.step_id);
#else
    return optionalValue(get().stepid);
#endif
}

Owned<JobFilters> JobFilters::create() {
    auto filters = Owned<JobFilters>::allocZeroed();
#if SLURMPLUS_HAVE_JOB_COND_WITHOUT_USAGE_TRUNCATION
    filters.raw()->without_usage_truncation = 1;
#else
    filters.raw()->flags |= JOBCOND_FLAG_NO_TRUNC;
#endif
    return filters;
}

JobFilters& JobFilters::setUsageStart(Timestamp start) noexcept {
    get().usage_start = toRaw(start);
    return *this;
}

JobFilters& JobFilters::setUsageEnd(Timestamp end) noexcept {
    get().usage_end = toRaw(end);
    return *this;
}

bool JobFilters::withoutUsageTruncation() const noexcept {
#if SLURMPLUS_HAVE_JOB_COND_WITHOUT_USAGE_TRUNCATION
    return get().without_usage_truncation != 0;
#else
    return (get().flags & JOBCOND_FLAG_NO_TRUNC) != 0;
#endif
}

DatabaseConnection DatabaseConnection::open() {
    LOG_DEBUG("Connecting to the accounting database");
#if SLURMPLUS_HAVE_CONNECTION_GET_FLAGS
    std::uint16_t persistFlags = 0;
    void* handle = slurmdb_connection_get(&persistFlags);
#else
    void* handle = slurmdb_connection_get();
#endif
    return DatabaseConnection(checkPointer(handle));
}

DatabaseConnection::~DatabaseConnection() {
    if (!handle_) {
        return;
    }
    int rc = slurmdb_connection_close(&handle_);
    if (rc != SLURM_SUCCESS) {
        LOG_WARN("Closing accounting database connection failed: " + describeCode(rc));
    }
    handle_ = nullptr;
}

OwnedList<JobRecord> DatabaseConnection::getJobs(const JobFilters& filters) const {
    if (!handle_) {
        throw std::logic_error("accounting database connection is closed");
    }
    SlurmListHandle jobs = checkPointer(slurmdb_jobs_get(handle_, filters.raw()));
    auto owned = OwnedList<JobRecord>::assume(jobs);
    LOG_DEBUG("Accounting query returned " + std::to_string(owned.size()) + " job records");
    return owned;
}

void DatabaseConnection::close() {
    if (!handle_) {
        return;
    }
    // Unlike most Slurm calls this one returns the error code itself.
    int rc = slurmdb_connection_close(&handle_);
    handle_ = nullptr;
    checkReturnedCode(rc);
}

}
