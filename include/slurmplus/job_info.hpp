/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

#include "slurmplus/owned.hpp"
#include "slurmplus/types.hpp"

#include <slurm/slurm.h>

namespace slurmplus {

// A job known to the controller (pending, running or recently finished).
// Always borrowed from the JobInfoMessage that holds it.
class JobInfo : public View<slurm_job_info_t> {
public:
    using View::View;

    [[nodiscard]] JobId jobId() const noexcept { return get().job_id; }
    [[nodiscard]] std::string name() const { return lossyText(get().name); }
    [[nodiscard]] std::string partition() const { return lossyText(get().partition); }
    [[nodiscard]] std::uint32_t userId() const noexcept { return get().user_id; }
    [[nodiscard]] JobState state() const noexcept { return jobStateFromRaw(get().job_state); }
    [[nodiscard]] std::optional<Timestamp> submitTime() const noexcept { return timestampFromRaw(get().submit_time); }
    [[nodiscard]] std::optional<Timestamp> startTime() const noexcept { return timestampFromRaw(get().start_time); }
    [[nodiscard]] std::optional<Timestamp> endTime() const noexcept { return timestampFromRaw(get().end_time); }

    // Minutes; none when unlimited or unset.
    [[nodiscard]] std::optional<std::uint32_t> timeLimit() const noexcept { return optionalValue(get().time_limit); }
};

class JobInfoMessage : public View<job_info_msg_t> {
public:
    using View::View;

    static void destroy(job_info_msg_t* msg) noexcept { slurm_free_job_info_msg(msg); }

    [[nodiscard]] std::size_t size() const noexcept { return get().record_count; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
    [[nodiscard]] std::optional<Timestamp> lastUpdate() const noexcept { return timestampFromRaw(get().last_update); }

    // Borrowed from this message. Throws std::out_of_range past the end.
    [[nodiscard]] JobInfo at(std::size_t index) const;

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = JobInfo;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = JobInfo;

        explicit Iterator(slurm_job_info_t* pos) noexcept : pos_(pos) {}

        JobInfo operator*() const noexcept { return borrow<JobInfo>(pos_); }
        Iterator& operator++() noexcept {
            ++pos_;
            return *this;
        }
        Iterator operator++(int) noexcept {
            Iterator before = *this;
            ++pos_;
            return before;
        }
        bool operator==(const Iterator& other) const noexcept { return pos_ == other.pos_; }
        bool operator!=(const Iterator& other) const noexcept { return pos_ != other.pos_; }

    private:
        slurm_job_info_t* pos_;
    };

    [[nodiscard]] Iterator begin() const noexcept { return Iterator(get().job_array); }
    [[nodiscard]] Iterator end() const noexcept { return Iterator(get().job_array + size()); }
};

// Response to a single-job query; use it like a JobInfo.
class SingleJobInfo final {
public:
    SingleJobInfo(Owned<JobInfoMessage> message, JobInfo info) noexcept
        : message_(std::move(message)), info_(info) {}

    [[nodiscard]] const JobInfo& info() const noexcept { return info_; }
    const JobInfo& operator*() const noexcept { return info_; }
    const JobInfo* operator->() const noexcept { return &info_; }

private:
    Owned<JobInfoMessage> message_;
    JobInfo info_;
};

// Only jobs the controller still knows about can be found; anything older
// fails with ErrorKind::InvalidJobId.
[[nodiscard]] SingleJobInfo getJobInfo(JobId jobId);

[[nodiscard]] Owned<JobInfoMessage> loadJobs(bool showAll = false);

}
