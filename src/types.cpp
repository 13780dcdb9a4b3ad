/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slurmplus/types.hpp"
#include "slurmplus/features.hpp"
#include <slurm/slurm.h>

namespace slurmplus {

JobState jobStateFromRaw(std::uint32_t raw) noexcept {
    switch (raw & JOB_STATE_BASE) {
        case JOB_PENDING:   return JobState::Pending;
        case JOB_RUNNING:   return JobState::Running;
        case JOB_SUSPENDED: return JobState::Suspended;
        case JOB_COMPLETE:  return JobState::Complete;
        case JOB_CANCELLED: return JobState::Cancelled;
        case JOB_FAILED:    return JobState::Failed;
        case JOB_TIMEOUT:   return JobState::Timeout;
        case JOB_NODE_FAIL: return JobState::NodeFail;
        case JOB_PREEMPTED: return JobState::Preempted;
        case JOB_BOOT_FAIL: return JobState::BootFail;
#if SLURMPLUS_HAVE_JOB_STATE_DEADLINE
        case JOB_DEADLINE:  return JobState::Deadline;
#endif
#if SLURMPLUS_HAVE_JOB_STATE_OOM
        case JOB_OOM:       return JobState::OutOfMemory;
#endif
        default:            return JobState::Unknown;
    }
}

const char* shortcode(JobState state) noexcept {
    switch (state) {
        case JobState::Pending:     return "PD";
        case JobState::Running:     return "R";
        case JobState::Suspended:   return "S";
        case JobState::Complete:    return "CD";
        case JobState::Cancelled:   return "CA";
        case JobState::Failed:      return "F";
        case JobState::Timeout:     return "TO";
        case JobState::NodeFail:    return "NF";
        case JobState::Preempted:   return "PR";
        case JobState::BootFail:    return "BF";
        case JobState::Deadline:    return "DL";
        case JobState::OutOfMemory: return "OOM";
        default:                    return "??";
    }
}

const char* toString(JobState state) noexcept {
    switch (state) {
        case JobState::Pending:     return "pending";
        case JobState::Running:     return "running";
        case JobState::Suspended:   return "suspended";
        case JobState::Complete:    return "complete";
        case JobState::Cancelled:   return "cancelled";
        case JobState::Failed:      return "failed";
        case JobState::Timeout:     return "timeout";
        case JobState::NodeFail:    return "node-fail";
        case JobState::Preempted:   return "preempted";
        case JobState::BootFail:    return "boot-fail";
        case JobState::Deadline:    return "deadline";
        case JobState::OutOfMemory: return "out-of-memory";
        default:                    return "unknown";
    }
}

std::optional<Timestamp> timestampFromRaw(std::time_t raw) noexcept {
    if (raw == 0) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(raw);
}

std::optional<Duration> durationBetween(const std::optional<Timestamp>& start,
                                        const std::optional<Timestamp>& end) noexcept {
    if (!start || !end) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<Duration>(*end - *start);
}

std::optional<std::uint32_t> optionalValue(std::uint32_t raw) noexcept {
    if (raw == NO_VAL || raw == INFINITE) {
        return std::nullopt;
    }
    return raw;
}

std::optional<std::uint64_t> optionalValue64(std::uint64_t raw) noexcept {
    if (raw == NO_VAL64 || raw == INFINITE64) {
        return std::nullopt;
    }
    return raw;
}

}
