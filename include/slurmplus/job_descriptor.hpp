/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "slurmplus/error.hpp"
#include "slurmplus/owned.hpp"
#include "slurmplus/types.hpp"

#include <slurm/slurm.h>

namespace slurmplus {

// Reply to a batch submission.
class SubmitResponse : public View<submit_response_msg_t> {
public:
    using View::View;

    static void destroy(submit_response_msg_t* msg) noexcept {
        slurm_free_submit_response_response_msg(msg);
    }

    [[nodiscard]] JobId jobId() const noexcept { return get().job_id; }
    [[nodiscard]] StepId stepId() const noexcept { return get().step_id; }

    // The controller can report an error code alongside a valid job id; the
    // meaning of that combination is not documented, so both are exposed and
    // nothing is thrown.
    [[nodiscard]] std::optional<SlurmError> error() const;

    // Message from a job_submit plugin, if this Slurm supports them.
    [[nodiscard]] std::optional<std::string> userMessage() const;
};

// Description of a batch job to submit. Strings and string arrays set here
// are allocated with Slurm's allocator and freed, before the struct itself,
// when the owning Owned<JobDescriptor> goes away. Setters free the value
// they replace and return *this for chaining.
class JobDescriptor : public View<job_desc_msg_t> {
public:
    using View::View;

    // Zeroed allocation, then Slurm's own defaults (NO_VAL and friends).
    [[nodiscard]] static Owned<JobDescriptor> create();

    static void destroy(job_desc_msg_t* desc) noexcept;

    JobDescriptor& setName(std::string_view name);
    JobDescriptor& setScript(std::string_view script);
    JobDescriptor& setPartition(std::string_view partition);
    JobDescriptor& setStdinPath(std::string_view path);
    JobDescriptor& setStdoutPath(std::string_view path);
    JobDescriptor& setStderrPath(std::string_view path);

    JobDescriptor& setArgv(const std::vector<std::string>& argv);
    JobDescriptor& setArgv(std::initializer_list<std::string_view> argv);

    // Entries of the form NAME=value.
    JobDescriptor& setEnvironment(const std::vector<std::string>& env);
    // Copies the environment of the current process.
    JobDescriptor& inheritEnvironment();

    // Throws std::runtime_error if the path is not valid UTF-8.
    JobDescriptor& setWorkDir(const std::filesystem::path& dir);
    JobDescriptor& setWorkDirCwd();

    JobDescriptor& setNumTasks(std::uint32_t numTasks) noexcept;
    JobDescriptor& setTimeLimit(std::uint32_t minutes) noexcept;
    // uid and gid of the calling process.
    JobDescriptor& setUidCurrent() noexcept;

    [[nodiscard]] std::string name() const { return lossyText(get().name); }
    [[nodiscard]] std::string script() const { return lossyText(get().script); }
    [[nodiscard]] std::string partition() const { return lossyText(get().partition); }
    [[nodiscard]] std::string stdinPath() const { return lossyText(get().std_in); }
    [[nodiscard]] std::string stdoutPath() const { return lossyText(get().std_out); }
    [[nodiscard]] std::string stderrPath() const { return lossyText(get().std_err); }
    [[nodiscard]] std::string workDir() const { return lossyText(get().work_dir); }
    [[nodiscard]] std::vector<std::string> argv() const;
    [[nodiscard]] std::vector<std::string> environment() const;
    [[nodiscard]] std::optional<std::uint32_t> numTasks() const noexcept { return optionalValue(get().num_tasks); }
    [[nodiscard]] std::optional<std::uint32_t> timeLimit() const noexcept { return optionalValue(get().time_limit); }
    [[nodiscard]] std::uint32_t userId() const noexcept { return get().user_id; }
    [[nodiscard]] std::uint32_t groupId() const noexcept { return get().group_id; }

    // Blocks until the controller answers. Failures throw SlurmError.
    [[nodiscard]] Owned<SubmitResponse> submitBatch() const;
};

}
