/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <exception>
#include <string>

#include "slurmplus/config.hpp"
#include "slurmplus/types.hpp"

namespace slurmplus::cli {

enum class Style : uint8_t { Plain, Highlight, Green, Red, Yellow };

// ANSI-styled output. Styling is decided once per stream from the color mode
// and whether the stream is a terminal.
class ColorIo final {
public:
    explicit ColorIo(ColorMode mode);

    void print(Style style, const std::string& text);
    void println(Style style, const std::string& text);

    // "error: <first>" then "  caused by: <rest>", one per line, on stderr.
    void printErrorChain(const std::exception& error);

    [[nodiscard]] bool stdoutStyled() const noexcept { return stdoutStyled_; }

private:
    bool stdoutStyled_;
    bool stderrStyled_;
};

// Job state short code in a color that reflects how the job is doing.
void printState(ColorIo& cio, JobState state);

// Approximate, human-sized rendering: "3 days", "5 hours", "12 minutes", ...
[[nodiscard]] std::string durationToText(Duration duration);

}
