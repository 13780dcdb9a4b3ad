/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slurmplus/logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace slurmplus {

namespace {
std::mutex g_log_mutex;
LogLevel g_level = LogLevel::INFO;
bool g_level_set = false;
std::ostream* g_out = nullptr;

LogLevel levelFromEnv() noexcept {
    const char* value = std::getenv("SLURMPLUS_LOG_LEVEL");
    return value ? Logger::parseLevel(value) : LogLevel::INFO;
}

// Caller holds g_log_mutex.
LogLevel currentLevel() noexcept {
    if (!g_level_set) {
        g_level = levelFromEnv();
        g_level_set = true;
    }
    return g_level;
}

std::string timestampNow() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&secs, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}
}

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_set = true;
}

void Logger::initFromEnv() noexcept {
    const LogLevel level = levelFromEnv();
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_set = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return currentLevel();
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

void Logger::setOutput(std::ostream* out) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_out = out;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (!enabled(level)) {
        return;
    }
    try {
        std::string line = "[" + timestampNow() + "] [" + levelToString(level) + "] slurmplus: " + message;

        std::lock_guard<std::mutex> lock(g_log_mutex);
        std::ostream& out = g_out ? *g_out : std::cerr;
        out << line << std::endl;
    } catch (...) {
        // Logging runs in destructors and on the abort path; it must not throw.
    }
}

LogLevel Logger::parseLevel(const std::string& text) noexcept {
    std::string name;
    for (char c : text) {
        name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (name == "error") return LogLevel::ERROR;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "trace") return LogLevel::TRACE;
    return LogLevel::INFO;
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

}
