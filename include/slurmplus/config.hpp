/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace slurmplus {

enum class ColorMode : uint8_t { Auto, Always, Never };

// Runtime settings shared by the CLI and the examples. Command-line flags
// take precedence over anything read here.
struct Config {
    int spanDays = 7;
    std::size_t limit = 30;
    ColorMode color = ColorMode::Auto;
    std::optional<std::string> slurmConf;

    // SLURMPLUS_SPAN_DAYS, SLURMPLUS_LIMIT, SLURMPLUS_COLOR, NO_COLOR,
    // SLURMPLUS_SLURM_CONF. Unparseable values keep the defaults.
    [[nodiscard]] static Config fromEnv();
};

[[nodiscard]] std::optional<ColorMode> parseColorMode(const std::string& text) noexcept;

// Longest lookback the accounting query accepts, about a century.
constexpr int MAX_SPAN_DAYS = 36500;

// Decimal digits only, in [1, MAX_SPAN_DAYS].
[[nodiscard]] std::optional<int> parseSpanDays(const std::string& text) noexcept;
// Decimal digits only, at least 1.
[[nodiscard]] std::optional<std::size_t> parseLimit(const std::string& text) noexcept;

}
