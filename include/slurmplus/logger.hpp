/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>

namespace slurmplus {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Process-wide diagnostics for the library and its tools. Lines go to
// stderr unless redirected, so stdout stays clean for command output:
//   [2025-01-31 12:00:00.123] [WARN ] slurmplus: message
class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    // SLURMPLUS_LOG_LEVEL, INFO when unset.
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    // nullptr restores stderr. The stream must outlive its use here.
    static void setOutput(std::ostream* out) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Parses ERROR/WARN/INFO/DEBUG/TRACE, any case; unknown text gives INFO.
    [[nodiscard]] static LogLevel parseLevel(const std::string& text) noexcept;

private:
    static const char* levelToString(LogLevel level) noexcept;
};

}

#define LOG_ERROR(msg) ::slurmplus::Logger::error(msg)
#define LOG_WARN(msg)  ::slurmplus::Logger::warn(msg)
#define LOG_INFO(msg)  ::slurmplus::Logger::info(msg)
#define LOG_DEBUG(msg) ::slurmplus::Logger::debug(msg)
#define LOG_TRACE(msg) ::slurmplus::Logger::trace(msg)
