/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "colorio.hpp"
#include "slurmplus/error.hpp"
#include <chrono>
#include <cstdio>
#include <iostream>
#include <unistd.h>

namespace slurmplus::cli {

namespace {
bool wantStyle(ColorMode mode, int fd) {
    switch (mode) {
        case ColorMode::Always: return true;
        case ColorMode::Never:  return false;
        default:                return ::isatty(fd) != 0;
    }
}

const char* styleCode(Style style) noexcept {
    switch (style) {
        case Style::Highlight: return "\033[1m";
        case Style::Green:     return "\033[32m";
        case Style::Red:       return "\033[31m";
        case Style::Yellow:    return "\033[33m";
        default:               return "";
    }
}

void write(std::ostream& out, bool styled, Style style, const std::string& text) {
    if (styled && style != Style::Plain) {
        out << styleCode(style) << text << "\033[0m";
    } else {
        out << text;
    }
}
}

ColorIo::ColorIo(ColorMode mode)
    : stdoutStyled_(wantStyle(mode, STDOUT_FILENO)),
      stderrStyled_(wantStyle(mode, STDERR_FILENO)) {
}

void ColorIo::print(Style style, const std::string& text) {
    write(std::cout, stdoutStyled_, style, text);
}

void ColorIo::println(Style style, const std::string& text) {
    write(std::cout, stdoutStyled_, style, text);
    std::cout << '\n';
}

void ColorIo::printErrorChain(const std::exception& error) {
    const auto chain = describeErrorChain(error);
    std::cout.flush();

    bool first = true;
    for (const auto& cause : chain) {
        if (first) {
            write(std::cerr, stderrStyled_, Style::Red, "error:");
            first = false;
        } else {
            std::cerr << "  ";
            write(std::cerr, stderrStyled_, Style::Red, "caused by:");
        }
        std::cerr << " " << cause << "\n";
    }
    std::cerr.flush();
}

void printState(ColorIo& cio, JobState state) {
    Style style = Style::Plain;
    switch (state) {
        case JobState::Pending:
            style = Style::Plain;
            break;
        case JobState::Running:
            style = Style::Highlight;
            break;
        case JobState::Complete:
            style = Style::Green;
            break;
        case JobState::Cancelled:
        case JobState::Failed:
        case JobState::NodeFail:
        case JobState::BootFail:
        case JobState::Deadline:
        case JobState::OutOfMemory:
            style = Style::Red;
            break;
        case JobState::Suspended:
        case JobState::Timeout:
        case JobState::Preempted:
            style = Style::Yellow;
            break;
        default:
            break;
    }
    cio.print(style, shortcode(state));
}

std::string durationToText(Duration duration) {
    using namespace std::chrono;
    const auto secs = duration.count();
    const auto mins = duration_cast<minutes>(duration).count();
    const auto hrs = duration_cast<hours>(duration).count();
    const auto days = hrs / 24;

    if (days > 2) return std::to_string(days) + " days";
    if (hrs > 2) return std::to_string(hrs) + " hours";
    if (mins > 2) return std::to_string(mins) + " minutes";
    return std::to_string(secs) + " seconds";
}

}
