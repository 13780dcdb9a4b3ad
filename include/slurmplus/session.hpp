/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>

namespace slurmplus {

// Library-wide setup. Slurm 20.11 and later must read slurm.conf through
// slurm_init() before any daemon call; older releases need nothing. Create
// one Session near the top of main() and keep it for the process lifetime.
class Session final {
public:
    explicit Session(const std::optional<std::string>& confPath = std::nullopt);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;
};

}
