/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>

#include "colorio.hpp"
#include "slurmplus/types.hpp"

namespace slurmplus::cli {

struct RecentOptions {
    int spanDays = 7;
    std::size_t limit = 30;
};

// Recent jobs of the current user, array jobs grouped, oldest first.
[[nodiscard]] int runRecent(ColorIo& cio, const RecentOptions& options);

// Timing and step summary of one job from the accounting database.
[[nodiscard]] int runStatus(ColorIo& cio, JobId jobId);

}
