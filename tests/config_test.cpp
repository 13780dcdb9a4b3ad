/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

// Tests for environment-driven configuration and log level parsing

#include "slurmplus/config.hpp"
#include "slurmplus/logger.hpp"
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

using namespace slurmplus;

namespace {
void clearEnv() {
    unsetenv("SLURMPLUS_SPAN_DAYS");
    unsetenv("SLURMPLUS_LIMIT");
    unsetenv("SLURMPLUS_COLOR");
    unsetenv("SLURMPLUS_SLURM_CONF");
    unsetenv("NO_COLOR");
}
}

void test_defaults() {
    std::cout << "Testing defaults with an empty environment..." << std::endl;

    clearEnv();
    Config config = Config::fromEnv();
    assert(config.spanDays == 7);
    assert(config.limit == 30);
    assert(config.color == ColorMode::Auto);
    assert(!config.slurmConf);

    std::cout << "✓ Defaults: 7 days, 30 groups, automatic color" << std::endl;
}

void test_overrides() {
    std::cout << "Testing environment overrides..." << std::endl;

    clearEnv();
    setenv("SLURMPLUS_SPAN_DAYS", "3", 1);
    setenv("SLURMPLUS_LIMIT", "5", 1);
    setenv("SLURMPLUS_COLOR", "Always", 1);
    setenv("SLURMPLUS_SLURM_CONF", "/etc/slurm/test.conf", 1);

    Config config = Config::fromEnv();
    assert(config.spanDays == 3);
    assert(config.limit == 5);
    assert(config.color == ColorMode::Always);
    assert(config.slurmConf && *config.slurmConf == "/etc/slurm/test.conf");

    setenv("NO_COLOR", "1", 1);
    assert(Config::fromEnv().color == ColorMode::Never);

    // An empty NO_COLOR does not count.
    setenv("NO_COLOR", "", 1);
    assert(Config::fromEnv().color == ColorMode::Always);

    clearEnv();
    std::cout << "✓ Environment values replace the defaults" << std::endl;
}

void test_invalid_values_keep_defaults() {
    std::cout << "Testing invalid environment values..." << std::endl;

    clearEnv();
    setenv("SLURMPLUS_SPAN_DAYS", "soon", 1);
    setenv("SLURMPLUS_LIMIT", "0", 1);
    setenv("SLURMPLUS_COLOR", "sometimes", 1);

    Config config = Config::fromEnv();
    assert(config.spanDays == 7);
    assert(config.limit == 30);
    assert(config.color == ColorMode::Auto);

    setenv("SLURMPLUS_SPAN_DAYS", "-2", 1);
    assert(Config::fromEnv().spanDays == 7);

    // Too large for an int: must not wrap into a different lookback.
    setenv("SLURMPLUS_SPAN_DAYS", "2147483648", 1);
    assert(Config::fromEnv().spanDays == 7);
    setenv("SLURMPLUS_SPAN_DAYS", "4294967297", 1);
    assert(Config::fromEnv().spanDays == 7);

    setenv("SLURMPLUS_LIMIT", "-5", 1);
    assert(Config::fromEnv().limit == 30);

    clearEnv();
    std::cout << "✓ Unparseable values fall back to the defaults" << std::endl;
}

void test_span_and_limit_bounds() {
    std::cout << "Testing span and limit parsing..." << std::endl;

    assert(parseSpanDays("1") == 1);
    assert(parseSpanDays("30") == 30);
    assert(parseSpanDays(std::to_string(MAX_SPAN_DAYS)) == MAX_SPAN_DAYS);
    assert(!parseSpanDays(std::to_string(MAX_SPAN_DAYS + 1)));
    assert(!parseSpanDays("2147483648"));
    assert(!parseSpanDays("4294967297"));
    assert(!parseSpanDays("99999999999999999999999"));
    assert(!parseSpanDays("0"));
    assert(!parseSpanDays("-1"));
    assert(!parseSpanDays("+3"));
    assert(!parseSpanDays(" 3"));
    assert(!parseSpanDays("3d"));
    assert(!parseSpanDays(""));

    assert(parseLimit("5") == std::size_t{5});
    assert(parseLimit("18446744073709551615") == std::size_t{18446744073709551615ull});
    assert(!parseLimit("18446744073709551616"));
    assert(!parseLimit("0"));
    assert(!parseLimit("-5"));
    assert(!parseLimit("ten"));

    std::cout << "✓ Out-of-range spans and limits are rejected, never wrapped" << std::endl;
}

void test_parse_color_mode() {
    std::cout << "Testing color mode parsing..." << std::endl;

    assert(parseColorMode("auto") == ColorMode::Auto);
    assert(parseColorMode("always") == ColorMode::Always);
    assert(parseColorMode("YES") == ColorMode::Always);
    assert(parseColorMode("never") == ColorMode::Never);
    assert(parseColorMode("no") == ColorMode::Never);
    assert(!parseColorMode(""));
    assert(!parseColorMode("blue"));

    std::cout << "✓ Color modes parse case-insensitively" << std::endl;
}

void test_log_levels() {
    std::cout << "Testing log level parsing..." << std::endl;

    assert(Logger::parseLevel("ERROR") == LogLevel::ERROR);
    assert(Logger::parseLevel("warn") == LogLevel::WARN);
    assert(Logger::parseLevel("Debug") == LogLevel::DEBUG);
    assert(Logger::parseLevel("trace") == LogLevel::TRACE);
    assert(Logger::parseLevel("chatty") == LogLevel::INFO);

    Logger::setLevel(LogLevel::DEBUG);
    assert(Logger::level() == LogLevel::DEBUG);

    setenv("SLURMPLUS_LOG_LEVEL", "error", 1);
    Logger::initFromEnv();
    assert(Logger::level() == LogLevel::ERROR);
    unsetenv("SLURMPLUS_LOG_LEVEL");

    std::cout << "✓ Log levels parse by name with INFO as the fallback" << std::endl;
}

void test_log_output() {
    std::cout << "Testing log filtering and line format..." << std::endl;

    std::ostringstream captured;
    Logger::setOutput(&captured);
    Logger::setLevel(LogLevel::WARN);

    assert(Logger::enabled(LogLevel::ERROR));
    assert(Logger::enabled(LogLevel::WARN));
    assert(!Logger::enabled(LogLevel::INFO));

    LOG_INFO("hidden detail");
    LOG_DEBUG("hidden debug");
    assert(captured.str().empty());

    LOG_WARN("accounting database slow");
    const std::string line = captured.str();
    assert(line.front() == '[');
    assert(line.find("] [WARN ] slurmplus: accounting database slow\n") != std::string::npos);
    assert(line.find("hidden") == std::string::npos);

    Logger::setOutput(nullptr);
    Logger::setLevel(LogLevel::INFO);

    std::cout << "✓ Lines below the level are dropped, the rest carry level and tag" << std::endl;
}

int main() {
    std::cout << "\n=== Configuration Test Suite ===" << std::endl;

    test_defaults();
    test_overrides();
    test_invalid_values_keep_defaults();
    test_span_and_limit_bounds();
    test_parse_color_mode();
    test_log_levels();
    test_log_output();

    std::cout << "\n✅ All configuration tests passed!" << std::endl;
    return 0;
}
