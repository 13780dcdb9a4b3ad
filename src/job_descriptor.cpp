/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slurmplus/job_descriptor.hpp"
#include "slurmplus/features.hpp"
#include "slurmplus/logger.hpp"
#include <stdexcept>
#include <unistd.h>

extern "C" {
extern char** environ;
}

namespace slurmplus {

namespace {
void replaceString(char*& field, std::string_view value) {
    char* fresh = foreign::allocateString(value);
    foreign::release(field);
    field = fresh;
}

template <typename Count>
void replaceStringArray(char**& field, Count& count, const std::vector<std::string_view>& values) {
    foreign::StringArray fresh = foreign::allocateStringArray(values);
    foreign::releaseStringArray(field, count);
    field = fresh.data;
    count = static_cast<Count>(fresh.count);
}

std::vector<std::string> readStringArray(char* const* array, std::size_t count) {
    std::vector<std::string> out;
    if (!array) {
        return out;
    }
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(lossyText(array[i]));
    }
    return out;
}
}

std::optional<SlurmError> SubmitResponse::error() const {
    if (get().error_code == 0) {
        return std::nullopt;
    }
    return SlurmError::fromCode(static_cast<int>(get().error_code));
}

std::optional<std::string> SubmitResponse::userMessage() const {
#if SLURMPLUS_HAVE_SUBMIT_RESPONSE_USER_MSG
    if (get().job_submit_user_msg) {
        return lossyText(get().job_submit_user_msg);
    }
#endif
    return std::nullopt;
}

Owned<JobDescriptor> JobDescriptor::create() {
    auto desc = Owned<JobDescriptor>::allocZeroed();
    slurm_init_job_desc_msg(desc.raw());
    return desc;
}

void JobDescriptor::destroy(job_desc_msg_t* desc) noexcept {
    if (!desc) {
        return;
    }
    foreign::release(desc->name);
    foreign::release(desc->script);
    foreign::release(desc->partition);
    foreign::release(desc->std_in);
    foreign::release(desc->std_out);
    foreign::release(desc->std_err);
    foreign::release(desc->work_dir);
    foreign::releaseStringArray(desc->argv, desc->argc);
    desc->argc = 0;
    foreign::releaseStringArray(desc->environment, desc->env_size);
    desc->env_size = 0;
    foreign::release(desc);
}

JobDescriptor& JobDescriptor::setName(std::string_view name) {
    replaceString(get().name, name);
    return *this;
}

JobDescriptor& JobDescriptor::setScript(std::string_view script) {
    replaceString(get().script, script);
    return *this;
}

JobDescriptor& JobDescriptor::setPartition(std::string_view partition) {
    replaceString(get().partition, partition);
    return *this;
}

JobDescriptor& JobDescriptor::setStdinPath(std::string_view path) {
    replaceString(get().std_in, path);
    return *this;
}

JobDescriptor& JobDescriptor::setStdoutPath(std::string_view path) {
    replaceString(get().std_out, path);
    return *this;
}

JobDescriptor& JobDescriptor::setStderrPath(std::string_view path) {
    replaceString(get().std_err, path);
    return *this;
}

JobDescriptor& JobDescriptor::setArgv(const std::vector<std::string>& argv) {
    replaceStringArray(get().argv, get().argc, std::vector<std::string_view>(argv.begin(), argv.end()));
    return *this;
}

JobDescriptor& JobDescriptor::setArgv(std::initializer_list<std::string_view> argv) {
    replaceStringArray(get().argv, get().argc, std::vector<std::string_view>(argv));
    return *this;
}

JobDescriptor& JobDescriptor::setEnvironment(const std::vector<std::string>& env) {
    replaceStringArray(get().environment, get().env_size,
                       std::vector<std::string_view>(env.begin(), env.end()));
    return *this;
}

JobDescriptor& JobDescriptor::inheritEnvironment() {
    std::vector<std::string_view> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        env.emplace_back(*entry);
    }
    replaceStringArray(get().environment, get().env_size, env);
    LOG_TRACE("Inherited " + std::to_string(env.size()) + " environment variables");
    return *this;
}

JobDescriptor& JobDescriptor::setWorkDir(const std::filesystem::path& dir) {
    const std::string& text = dir.native();
    if (!isValidUtf8(text)) {
        throw std::runtime_error("path is not valid UTF-8: " + lossyText(text));
    }
    replaceString(get().work_dir, text);
    return *this;
}

JobDescriptor& JobDescriptor::setWorkDirCwd() {
    return setWorkDir(std::filesystem::current_path());
}

JobDescriptor& JobDescriptor::setNumTasks(std::uint32_t numTasks) noexcept {
    get().num_tasks = numTasks;
    return *this;
}

JobDescriptor& JobDescriptor::setTimeLimit(std::uint32_t minutes) noexcept {
    get().time_limit = minutes;
    return *this;
}

JobDescriptor& JobDescriptor::setUidCurrent() noexcept {
    get().user_id = ::getuid();
    get().group_id = ::getgid();
    return *this;
}

std::vector<std::string> JobDescriptor::argv() const {
    return readStringArray(get().argv, get().argc);
}

std::vector<std::string> JobDescriptor::environment() const {
    return readStringArray(get().environment, get().env_size);
}

Owned<SubmitResponse> JobDescriptor::submitBatch() const {
    LOG_DEBUG("Submitting batch job '" + name() + "'");
    submit_response_msg_t* resp = nullptr;
    checkStatus(slurm_submit_batch_job(raw(), &resp));
    auto response = Owned<SubmitResponse>::assume(resp);
    LOG_INFO("Submitted batch job " + std::to_string(response->jobId()));
    return response;
}

}
