/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slurmplus/job_info.hpp"
#include "slurmplus/error.hpp"
#include "slurmplus/logger.hpp"
#include <stdexcept>

namespace slurmplus {

JobInfo JobInfoMessage::at(std::size_t index) const {
    if (index >= size()) {
        throw std::out_of_range("job record " + std::to_string(index) + " out of range (" +
                                std::to_string(size()) + " records)");
    }
    slurm_job_info_t* const record = &get().job_array[index];
    return borrow<JobInfo>(record);
}

SingleJobInfo getJobInfo(JobId jobId) {
    LOG_DEBUG("Loading job info for " + std::to_string(jobId));

    job_info_msg_t* resp = nullptr;
    checkStatus(slurm_load_job(&resp, jobId, 0));
    auto message = Owned<JobInfoMessage>::assume(resp);

    const std::size_t count = message->size();
    if (count != 1) {
        throw std::runtime_error("expected exactly one info record for job " +
                                 std::to_string(jobId) + "; got " + std::to_string(count) + " items");
    }

    JobInfo info = message->at(0);
    return SingleJobInfo(std::move(message), info);
}

Owned<JobInfoMessage> loadJobs(bool showAll) {
    job_info_msg_t* resp = nullptr;
    checkStatus(slurm_load_jobs(0, &resp, showAll ? SHOW_ALL : 0));
    auto message = Owned<JobInfoMessage>::assume(resp);
    LOG_DEBUG("Loaded " + std::to_string(message->size()) + " job records");
    return message;
}

}
