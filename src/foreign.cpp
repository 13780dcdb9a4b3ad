/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slurmplus/foreign.hpp"
#include "slurmplus/features.hpp"
#include "slurmplus/logger.hpp"
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>

// Slurm's allocator is not part of its public headers. The allocation and
// the free entry points changed shape separately; each is probed on its own.
extern "C" {
#if SLURMPLUS_HAVE_XCALLOC
void* slurm_xcalloc(size_t count, size_t size, bool clear, bool try_alloc,
                    const char* file, int line, const char* func);
#else
void* slurm_try_xmalloc(size_t size, const char* file, int line, const char* func);
#endif
#if SLURMPLUS_HAVE_XFREE_ONE_ARG
void slurm_xfree(void** ptr);
#else
void slurm_xfree(void** ptr, const char* file, int line, const char* func);
#endif
}

namespace slurmplus::foreign {

namespace {
// Caller tag for xmalloc's bookkeeping.
constexpr const char* ALLOC_TAG = "slurmplus";
}

void fatal(const std::string& what) noexcept {
    LOG_ERROR("fatal: " + what);
    std::abort();
}

void* allocateBytes(std::size_t count, std::size_t size) {
    if (count == 0 || size == 0) {
        return nullptr;
    }
    if (size > std::numeric_limits<std::size_t>::max() / count) {
        fatal("allocation of " + std::to_string(count) + " x " + std::to_string(size) +
              " bytes overflows");
    }

#if SLURMPLUS_HAVE_XCALLOC
    void* ptr = slurm_xcalloc(count, size, true, true, ALLOC_TAG, __LINE__, __func__);
#else
    void* ptr = slurm_try_xmalloc(count * size, ALLOC_TAG, __LINE__, __func__);
#endif

    if (!ptr) {
        fatal("Slurm allocator could not provide " + std::to_string(count * size) + " bytes");
    }
    return ptr;
}

void releaseBytes(void* ptr) noexcept {
    if (!ptr) {
        return;
    }
#if SLURMPLUS_HAVE_XFREE_ONE_ARG
    slurm_xfree(&ptr);
#else
    slurm_xfree(&ptr, ALLOC_TAG, __LINE__, __func__);
#endif
}

char* allocateString(std::string_view text) {
    char* buf = allocateArray<char>(text.size() + 1);
    std::memcpy(buf, text.data(), text.size());
    buf[text.size()] = '\0';
    return buf;
}

StringArray allocateStringArray(const std::vector<std::string_view>& strings) {
    StringArray result;
    result.count = strings.size();
    result.data = allocateArray<char*>(result.count);
    for (std::size_t i = 0; i < result.count; ++i) {
        result.data[i] = allocateString(strings[i]);
    }
    return result;
}

StringArray allocateStringArray(std::initializer_list<std::string_view> strings) {
    return allocateStringArray(std::vector<std::string_view>(strings));
}

void releaseStringArray(char**& array, std::size_t count) noexcept {
    if (!array) {
        return;
    }
    for (std::size_t i = 0; i < count; ++i) {
        release(array[i]);
    }
    release(array);
}

}
