/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slurmplus/session.hpp"
#include "slurmplus/features.hpp"
#include "slurmplus/logger.hpp"
#include <slurm/slurm.h>

namespace slurmplus {

Session::Session(const std::optional<std::string>& confPath) {
#if SLURMPLUS_HAVE_SLURM_INIT
    LOG_DEBUG("Initializing libslurm" + (confPath ? " with " + *confPath : std::string()));
    slurm_init(confPath ? confPath->c_str() : nullptr);
#else
    if (confPath) {
        LOG_WARN("This libslurm has no slurm_init(); ignoring config path " + *confPath);
    }
#endif
}

Session::~Session() {
#if SLURMPLUS_HAVE_SLURM_INIT
    slurm_fini();
#endif
}

}
