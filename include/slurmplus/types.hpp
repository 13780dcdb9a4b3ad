/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>

namespace slurmplus {

// Slurm job identifiers are always 32-bit.
using JobId = std::uint32_t;
using StepId = std::uint32_t;

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::seconds;

// Base job states; the flag bits Slurm ORs into the raw value are dropped.
enum class JobState : std::uint8_t {
    Pending,
    Running,
    Suspended,
    Complete,
    Cancelled,
    Failed,
    Timeout,
    NodeFail,
    Preempted,
    BootFail,
    Deadline,
    OutOfMemory,
    Unknown
};

[[nodiscard]] JobState jobStateFromRaw(std::uint32_t raw) noexcept;
[[nodiscard]] const char* shortcode(JobState state) noexcept;
[[nodiscard]] const char* toString(JobState state) noexcept;

// Slurm uses 0 for "not yet happened", not the epoch.
[[nodiscard]] std::optional<Timestamp> timestampFromRaw(std::time_t raw) noexcept;

// Present only when both ends are present.
[[nodiscard]] std::optional<Duration> durationBetween(const std::optional<Timestamp>& start,
                                                      const std::optional<Timestamp>& end) noexcept;

// NO_VAL and INFINITE mean "unset".
[[nodiscard]] std::optional<std::uint32_t> optionalValue(std::uint32_t raw) noexcept;
[[nodiscard]] std::optional<std::uint64_t> optionalValue64(std::uint64_t raw) noexcept;

}
