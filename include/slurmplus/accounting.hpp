/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

#include "slurmplus/list.hpp"
#include "slurmplus/owned.hpp"
#include "slurmplus/types.hpp"

#include <slurm/slurm.h>
#include <slurm/slurmdb.h>

namespace slurmplus {

// Fields that job records and step records in the accounting database both
// carry. The conversions live here once; each record type only says where
// its raw values are.
class SharedRecordFields {
public:
    virtual ~SharedRecordFields() = default;

    [[nodiscard]] std::optional<Timestamp> startTime() const noexcept { return timestampFromRaw(rawStart()); }
    [[nodiscard]] std::optional<Timestamp> endTime() const noexcept { return timestampFromRaw(rawEnd()); }

    // Present once both the start and the end have been recorded.
    [[nodiscard]] std::optional<Duration> wallclockDuration() const noexcept {
        return durationBetween(startTime(), endTime());
    }

    // Raw Slurm exit code (status << 8 | signal); only meaningful once ended.
    [[nodiscard]] std::optional<std::uint32_t> exitCode() const noexcept {
        if (!endTime()) {
            return std::nullopt;
        }
        return rawExitCode();
    }

    [[nodiscard]] JobState state() const noexcept { return jobStateFromRaw(rawState()); }

protected:
    SharedRecordFields() = default;
    SharedRecordFields(const SharedRecordFields&) = default;
    SharedRecordFields& operator=(const SharedRecordFields&) = default;

    [[nodiscard]] virtual std::time_t rawStart() const noexcept = 0;
    [[nodiscard]] virtual std::time_t rawEnd() const noexcept = 0;
    [[nodiscard]] virtual std::uint32_t rawExitCode() const noexcept = 0;
    [[nodiscard]] virtual std::uint32_t rawState() const noexcept = 0;
};

class StepRecord : public View<slurmdb_step_rec_t>, public SharedRecordFields {
public:
    using View::View;

    static void destroy(slurmdb_step_rec_t* step) noexcept { slurmdb_destroy_step_rec(step); }

    [[nodiscard]] StepId stepId() const noexcept;
    [[nodiscard]] std::string stepName() const { return lossyText(get().stepname); }

    // Peak virtual memory in KiB; none until the step has finished.
    [[nodiscard]] std::optional<std::uint64_t> maxVmSize() const noexcept;

protected:
    std::time_t rawStart() const noexcept override { return get().start; }
    std::time_t rawEnd() const noexcept override { return get().end; }
    std::uint32_t rawExitCode() const noexcept override { return static_cast<std::uint32_t>(get().exitcode); }
    std::uint32_t rawState() const noexcept override { return static_cast<std::uint32_t>(get().state); }
};

class JobRecord : public View<slurmdb_job_rec_t>, public SharedRecordFields {
public:
    using View::View;

    static void destroy(slurmdb_job_rec_t* job) noexcept { slurmdb_destroy_job_rec(job); }

    [[nodiscard]] JobId jobId() const noexcept { return get().jobid; }
    [[nodiscard]] std::string jobName() const { return lossyText(get().jobname); }
    [[nodiscard]] std::string partition() const { return lossyText(get().partition); }
    [[nodiscard]] std::string account() const { return lossyText(get().account); }
    [[nodiscard]] std::string userName() const { return lossyText(get().user); }
    [[nodiscard]] std::uint32_t uid() const noexcept { return get().uid; }
    [[nodiscard]] std::uint32_t gid() const noexcept { return get().gid; }

    // Id of the array this job belongs to; none for plain jobs.
    [[nodiscard]] std::optional<JobId> arrayJobId() const noexcept {
        if (get().array_job_id == 0) {
            return std::nullopt;
        }
        return get().array_job_id;
    }
    [[nodiscard]] std::optional<std::uint32_t> arrayTaskId() const noexcept { return optionalValue(get().array_task_id); }

    [[nodiscard]] std::optional<Timestamp> submitTime() const noexcept { return timestampFromRaw(get().submit); }
    [[nodiscard]] std::optional<Timestamp> eligibleTime() const noexcept { return timestampFromRaw(get().eligible); }

    // Minutes; none when unlimited or unset.
    [[nodiscard]] std::optional<std::uint32_t> timeLimit() const noexcept { return optionalValue(get().timelimit); }

    // submit -> eligible
    [[nodiscard]] std::optional<Duration> eligibleWaitDuration() const noexcept {
        return durationBetween(submitTime(), eligibleTime());
    }
    // submit -> start
    [[nodiscard]] std::optional<Duration> waitDuration() const noexcept {
        return durationBetween(submitTime(), startTime());
    }
    // eligible -> start
    [[nodiscard]] std::optional<Duration> startDelayAfterEligible() const noexcept {
        return durationBetween(eligibleTime(), startTime());
    }

    // Borrowed from this record.
    [[nodiscard]] ForeignList<StepRecord> steps() const noexcept { return ForeignList<StepRecord>::borrow(get().steps); }

protected:
    std::time_t rawStart() const noexcept override { return get().start; }
    std::time_t rawEnd() const noexcept override { return get().end; }
    std::uint32_t rawExitCode() const noexcept override { return static_cast<std::uint32_t>(get().exitcode); }
    std::uint32_t rawState() const noexcept override { return static_cast<std::uint32_t>(get().state); }
};

// Selects one job (all of its steps) in an accounting query.
class JobStepFilter : public View<slurmdb_selected_step_t> {
public:
    using View::View;

    static void destroy(slurmdb_selected_step_t* step) noexcept { slurmdb_destroy_selected_step(step); }

    [[nodiscard]] static Owned<JobStepFilter> create(JobId jobId);

    [[nodiscard]] JobId jobId() const noexcept;
    // None means every step.
    [[nodiscard]] std::optional<StepId> stepId() const noexcept;
};

// Conditions for an accounting query. Created with usage truncation off so
// records report their real start and end times.
class JobFilters : public View<slurmdb_job_cond_t> {
public:
    using View::View;

    static void destroy(slurmdb_job_cond_t* cond) noexcept { slurmdb_destroy_job_cond(cond); }

    [[nodiscard]] static Owned<JobFilters> create();

    [[nodiscard]] ForeignList<JobStepFilter> stepList() const noexcept { return ForeignList<JobStepFilter>::borrow(get().step_list); }
    // Numeric uids, as text.
    [[nodiscard]] ForeignList<CString> useridList() const noexcept { return ForeignList<CString>::borrow(get().userid_list); }
    [[nodiscard]] ForeignList<CString> partitionList() const noexcept { return ForeignList<CString>::borrow(get().partition_list); }

    JobFilters& setUsageStart(Timestamp start) noexcept;
    JobFilters& setUsageEnd(Timestamp end) noexcept;
    [[nodiscard]] std::optional<Timestamp> usageStart() const noexcept { return timestampFromRaw(get().usage_start); }
    [[nodiscard]] std::optional<Timestamp> usageEnd() const noexcept { return timestampFromRaw(get().usage_end); }

    [[nodiscard]] bool withoutUsageTruncation() const noexcept;
};

// Connection to slurmdbd. Closed when destroyed; call close() to see the
// outcome of closing.
class DatabaseConnection final {
public:
    [[nodiscard]] static DatabaseConnection open();

    ~DatabaseConnection();

    DatabaseConnection(const DatabaseConnection&) = delete;
    DatabaseConnection& operator=(const DatabaseConnection&) = delete;
    DatabaseConnection(DatabaseConnection&& other) noexcept : handle_(other.handle_) { other.handle_ = nullptr; }
    DatabaseConnection& operator=(DatabaseConnection&&) = delete;

    [[nodiscard]] bool isOpen() const noexcept { return handle_ != nullptr; }

    // Blocks until slurmdbd answers. Throws SlurmError on failure.
    [[nodiscard]] OwnedList<JobRecord> getJobs(const JobFilters& filters) const;

    void close();

private:
    explicit DatabaseConnection(void* handle) noexcept : handle_(handle) {}

    void* handle_;
};

// Value for TRES id `id` in a Slurm TRES string ("1=4,2=1024,7=..."), if present.
[[nodiscard]] std::optional<std::uint64_t> parseTresValue(const char* tres, int id) noexcept;

}
