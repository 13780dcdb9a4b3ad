/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

// Typed access to Slurm's own allocator. Anything Slurm will later free
// (strings in a job descriptor, elements handed to a Slurm list, ...) must
// come from here, never from new/malloc.
//
// Slurm has no graceful out-of-memory path and neither does this layer:
// allocation failure logs and aborts the process.
namespace slurmplus::foreign {

struct StringArray {
    char** data = nullptr;
    std::size_t count = 0;
};

[[noreturn]] void fatal(const std::string& what) noexcept;

// Zeroed block of count * size bytes. count == 0 yields nullptr.
[[nodiscard]] void* allocateBytes(std::size_t count, std::size_t size);
void releaseBytes(void* ptr) noexcept;

template <typename T>
[[nodiscard]] T* allocateZeroed() {
    return static_cast<T*>(allocateBytes(1, sizeof(T)));
}

template <typename T>
[[nodiscard]] T* allocateArray(std::size_t count) {
    return static_cast<T*>(allocateBytes(count, sizeof(T)));
}

// Frees through xfree and nulls the handle; a null handle is left alone.
template <typename T>
void release(T*& ptr) noexcept {
    if (!ptr) {
        return;
    }
    releaseBytes(static_cast<void*>(ptr));
    ptr = nullptr;
}

[[nodiscard]] char* allocateString(std::string_view text);

[[nodiscard]] StringArray allocateStringArray(const std::vector<std::string_view>& strings);
[[nodiscard]] StringArray allocateStringArray(std::initializer_list<std::string_view> strings);

// Any range of things convertible to std::string_view.
template <typename Range>
[[nodiscard]] StringArray allocateStringArray(const Range& strings) {
    std::vector<std::string_view> views;
    for (const auto& s : strings) {
        views.emplace_back(s);
    }
    return allocateStringArray(views);
}

void releaseStringArray(char**& array, std::size_t count) noexcept;

}
