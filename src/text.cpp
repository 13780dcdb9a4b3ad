/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slurmplus/text.hpp"
#include <cstdint>

namespace slurmplus {

namespace {
constexpr const char* REPLACEMENT = "\xEF\xBF\xBD";

// Bytes taken by the sequence starting at bytes[pos]. A well-formed
// sequence sets valid; otherwise the result is the length of the maximal
// invalid subpart (at least 1), which decodes to a single U+FFFD.
std::size_t scanSequence(std::string_view bytes, std::size_t pos, bool& valid) noexcept {
    const auto byte = [&](std::size_t i) { return static_cast<uint8_t>(bytes[i]); };
    const uint8_t lead = byte(pos);
    const std::size_t avail = bytes.size() - pos;

    valid = true;
    if (lead < 0x80) return 1;

    std::size_t len = 0;
    uint8_t lo = 0x80, hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;  // no surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        valid = false;
        return 1;
    }

    std::size_t taken = 1;
    while (taken < len && taken < avail) {
        const uint8_t next = byte(pos + taken);
        const uint8_t min = taken == 1 ? lo : 0x80;
        const uint8_t max = taken == 1 ? hi : 0xBF;
        if (next < min || next > max) break;
        ++taken;
    }
    valid = taken == len;
    return taken;
}
}

std::string lossyText(const char* text) {
    if (!text) return {};
    return lossyText(std::string_view(text));
}

std::string lossyText(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    std::size_t pos = 0;
    while (pos < bytes.size()) {
        bool valid = false;
        const std::size_t len = scanSequence(bytes, pos, valid);
        if (valid) {
            out.append(bytes.substr(pos, len));
        } else {
            out += REPLACEMENT;
        }
        pos += len;
    }
    return out;
}

bool isValidUtf8(std::string_view bytes) noexcept {
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        bool valid = false;
        pos += scanSequence(bytes, pos, valid);
        if (!valid) return false;
    }
    return true;
}

}
