/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <string_view>

namespace slurmplus {

// Decodes a C string from Slurm as UTF-8. Each maximal invalid subpart
// becomes one U+FFFD; a null pointer gives an empty string. Never fails.
[[nodiscard]] std::string lossyText(const char* text);
[[nodiscard]] std::string lossyText(std::string_view bytes);

[[nodiscard]] bool isValidUtf8(std::string_view bytes) noexcept;

}
