/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace slurmplus {

// Slurm error codes that callers are expected to care about. Every other
// code maps to ErrorKind::Other and keeps its number.
#define SLURMPLUS_EACH_MAPPED_ERROR(X)                              \
    X(InvalidJobId, ESLURM_INVALID_JOB_ID)                          \
    X(InvalidPartitionName, ESLURM_INVALID_PARTITION_NAME)          \
    X(AccessDenied, ESLURM_ACCESS_DENIED)                           \
    X(AlreadyDone, ESLURM_ALREADY_DONE)                             \
    X(DatabaseConnection, ESLURM_DB_CONNECTION)                     \
    X(InvalidTimeLimit, ESLURM_INVALID_TIME_LIMIT)                  \
    X(UserIdMissing, ESLURM_USER_ID_MISSING)

enum class ErrorKind : std::uint8_t {
#define SLURMPLUS_ERROR_ENUMERATOR(name, code) name,
    SLURMPLUS_EACH_MAPPED_ERROR(SLURMPLUS_ERROR_ENUMERATOR)
#undef SLURMPLUS_ERROR_ENUMERATOR
    Other
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

class SlurmError : public std::runtime_error {
public:
    [[nodiscard]] static SlurmError fromCode(int code);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] int code() const noexcept { return code_; }

private:
    SlurmError(ErrorKind kind, int code, const std::string& message);

    ErrorKind kind_;
    int code_;
};

// slurm_strerror text, decoded lossily, followed by " (Slurm errno N)".
[[nodiscard]] std::string describeCode(int code);

// Source of Slurm's "last error" register. Slurm keeps it as global state
// set by the failing call; it must be read straight after that call, on the
// same thread. Whether concurrent callers can interfere is up to libslurm
// and has not been verified.
using ErrnoReader = int (*)();

[[nodiscard]] int lastSlurmErrno() noexcept;

// Most calls return 0 on success and -1 on failure, with the actual code in
// the errno register.
void checkStatus(int rc, ErrnoReader readErrno = lastSlurmErrno);

// For calls whose return value is itself the Slurm error code.
void checkReturnedCode(int rc);

// Pointer-returning calls: null means failure, code in the errno register.
template <typename T>
T* checkPointer(T* ptr, ErrnoReader readErrno = lastSlurmErrno) {
    if (!ptr) {
        throw SlurmError::fromCode(readErrno());
    }
    return ptr;
}

// what() of the error and each std::nested_exception cause, outermost first.
[[nodiscard]] std::vector<std::string> describeErrorChain(const std::exception& error);

}
