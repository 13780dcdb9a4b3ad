/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slurmplus/error.hpp"
#include "slurmplus/logger.hpp"
#include "slurmplus/text.hpp"
#include <slurm/slurm.h>
#include <slurm/slurm_errno.h>

namespace slurmplus {

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
#define SLURMPLUS_ERROR_NAME(name, code) case ErrorKind::name: return #name;
        SLURMPLUS_EACH_MAPPED_ERROR(SLURMPLUS_ERROR_NAME)
#undef SLURMPLUS_ERROR_NAME
        default: return "Other";
    }
}

SlurmError::SlurmError(ErrorKind kind, int code, const std::string& message)
    : std::runtime_error(message), kind_(kind), code_(code) {
}

SlurmError SlurmError::fromCode(int code) {
    ErrorKind kind = ErrorKind::Other;
    switch (code) {
#define SLURMPLUS_ERROR_CASE(name, slurmCode) case slurmCode: kind = ErrorKind::name; break;
        SLURMPLUS_EACH_MAPPED_ERROR(SLURMPLUS_ERROR_CASE)
#undef SLURMPLUS_ERROR_CASE
        default: break;
    }
    return SlurmError(kind, code, describeCode(code));
}

std::string describeCode(int code) {
    return lossyText(slurm_strerror(code)) + " (Slurm errno " + std::to_string(code) + ")";
}

int lastSlurmErrno() noexcept {
    return slurm_get_errno();
}

void checkStatus(int rc, ErrnoReader readErrno) {
    if (rc == 0) {
        return;
    }
    const int code = readErrno();
    LOG_DEBUG("Slurm call returned " + std::to_string(rc) + ", errno " + std::to_string(code));
    throw SlurmError::fromCode(code);
}

void checkReturnedCode(int rc) {
    if (rc == SLURM_SUCCESS) {
        return;
    }
    throw SlurmError::fromCode(rc);
}

namespace {
void collectCauses(const std::exception& error, std::vector<std::string>& out) {
    out.emplace_back(error.what());
    try {
        std::rethrow_if_nested(error);
    } catch (const std::exception& cause) {
        collectCauses(cause, out);
    } catch (...) {
        out.emplace_back("unknown error");
    }
}
}

std::vector<std::string> describeErrorChain(const std::exception& error) {
    std::vector<std::string> chain;
    collectCauses(error, chain);
    return chain;
}

}
