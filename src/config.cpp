/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slurmplus/config.hpp"
#include "slurmplus/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace slurmplus {

namespace {
// Whole positive number no larger than maxValue. Signs, spaces and
// anything past the digits are rejected rather than skipped.
std::optional<unsigned long long> parseBounded(const std::string& text,
                                               unsigned long long maxValue) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    unsigned long long value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const unsigned digit = static_cast<unsigned>(c - '0');
        if (value > (maxValue - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    if (value == 0) {
        return std::nullopt;
    }
    return value;
}

template <typename T>
T env_value(const char* name, T defv, std::optional<T> (*parse)(const std::string&) noexcept) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    if (auto parsed = parse(val)) {
        return *parsed;
    }
    LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
    return defv;
}
}

std::optional<int> parseSpanDays(const std::string& text) noexcept {
    auto value = parseBounded(text, static_cast<unsigned long long>(MAX_SPAN_DAYS));
    if (!value) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

std::optional<std::size_t> parseLimit(const std::string& text) noexcept {
    auto value = parseBounded(text, std::numeric_limits<std::size_t>::max());
    if (!value) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(*value);
}

std::optional<ColorMode> parseColorMode(const std::string& text) noexcept {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "auto") return ColorMode::Auto;
    if (value == "always" || value == "yes") return ColorMode::Always;
    if (value == "never" || value == "no") return ColorMode::Never;
    return std::nullopt;
}

Config Config::fromEnv() {
    Config config;
    config.spanDays = env_value<int>("SLURMPLUS_SPAN_DAYS", config.spanDays, &parseSpanDays);
    config.limit = env_value<std::size_t>("SLURMPLUS_LIMIT", config.limit, &parseLimit);

    if (const char* color = std::getenv("SLURMPLUS_COLOR")) {
        if (auto mode = parseColorMode(color)) {
            config.color = *mode;
        } else {
            LOG_WARN(std::string("Ignoring invalid SLURMPLUS_COLOR=") + color);
        }
    }
    // https://no-color.org: any non-empty value disables color
    if (const char* noColor = std::getenv("NO_COLOR"); noColor && *noColor) {
        config.color = ColorMode::Never;
    }

    if (const char* conf = std::getenv("SLURMPLUS_SLURM_CONF"); conf && *conf) {
        config.slurmConf = std::string(conf);
    }
    return config;
}

}
