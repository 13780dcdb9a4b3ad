/*
 * slurmplus - Slurm workload manager interface
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

// Tests for Slurm error mapping, error chains and lossy text decoding

#include "slurmplus/error.hpp"
#include "slurmplus/logger.hpp"
#include "slurmplus/text.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <slurm/slurm_errno.h>

using namespace slurmplus;

namespace {
int g_reads = 0;
int g_registerValue = 0;

int fakeRegister() {
    ++g_reads;
    return g_registerValue;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}

void test_known_codes_map_to_kinds() {
    std::cout << "Testing mapping of known Slurm codes..." << std::endl;

    SlurmError invalidJob = SlurmError::fromCode(ESLURM_INVALID_JOB_ID);
    assert(invalidJob.kind() == ErrorKind::InvalidJobId);
    assert(invalidJob.code() == ESLURM_INVALID_JOB_ID);

    assert(SlurmError::fromCode(ESLURM_INVALID_PARTITION_NAME).kind() == ErrorKind::InvalidPartitionName);
    assert(SlurmError::fromCode(ESLURM_ACCESS_DENIED).kind() == ErrorKind::AccessDenied);
    assert(SlurmError::fromCode(ESLURM_ALREADY_DONE).kind() == ErrorKind::AlreadyDone);
    assert(SlurmError::fromCode(ESLURM_DB_CONNECTION).kind() == ErrorKind::DatabaseConnection);
    assert(SlurmError::fromCode(ESLURM_INVALID_TIME_LIMIT).kind() == ErrorKind::InvalidTimeLimit);
    assert(SlurmError::fromCode(ESLURM_USER_ID_MISSING).kind() == ErrorKind::UserIdMissing);

    assert(std::string(toString(ErrorKind::InvalidJobId)) == "InvalidJobId");
    assert(std::string(toString(ErrorKind::Other)) == "Other");

    std::cout << "✓ Known codes map to their kinds" << std::endl;
}

void test_unknown_code_keeps_number() {
    std::cout << "Testing fallback for unmapped codes..." << std::endl;

    SlurmError other = SlurmError::fromCode(987654);
    assert(other.kind() == ErrorKind::Other);
    assert(other.code() == 987654);
    assert(endsWith(other.what(), "(Slurm errno 987654)"));

    SlurmError mapped = SlurmError::fromCode(ESLURM_INVALID_JOB_ID);
    assert(endsWith(mapped.what(), "(Slurm errno " + std::to_string(ESLURM_INVALID_JOB_ID) + ")"));
    assert(std::string(mapped.what()).size() > std::string(" (Slurm errno )").size());

    std::cout << "✓ Unmapped codes become Other and keep the number" << std::endl;
}

void test_check_status_success_skips_register() {
    std::cout << "Testing checkStatus on success..." << std::endl;

    g_reads = 0;
    g_registerValue = ESLURM_ACCESS_DENIED;
    checkStatus(0, &fakeRegister);
    assert(g_reads == 0);

    std::cout << "✓ A zero status never consults the errno register" << std::endl;
}

void test_check_status_failure_reads_register() {
    std::cout << "Testing checkStatus on failure..." << std::endl;

    g_reads = 0;
    g_registerValue = ESLURM_INVALID_JOB_ID;
    bool thrown = false;
    try {
        checkStatus(-1, &fakeRegister);
    } catch (const SlurmError& e) {
        thrown = true;
        assert(e.kind() == ErrorKind::InvalidJobId);
        assert(e.code() == ESLURM_INVALID_JOB_ID);
    }
    assert(thrown);
    assert(g_reads == 1);

    std::cout << "✓ A failing status throws the error held in the register" << std::endl;
}

void test_check_returned_code() {
    std::cout << "Testing calls that return their own code..." << std::endl;

    checkReturnedCode(SLURM_SUCCESS);

    bool thrown = false;
    try {
        checkReturnedCode(ESLURM_ACCESS_DENIED);
    } catch (const SlurmError& e) {
        thrown = true;
        assert(e.kind() == ErrorKind::AccessDenied);
        assert(e.code() == ESLURM_ACCESS_DENIED);
    }
    assert(thrown);

    std::cout << "✓ Returned codes are used as-is" << std::endl;
}

void test_check_pointer() {
    std::cout << "Testing checkPointer..." << std::endl;

    int value = 5;
    g_reads = 0;
    assert(checkPointer(&value, &fakeRegister) == &value);
    assert(g_reads == 0);

    g_registerValue = ESLURM_DB_CONNECTION;
    bool thrown = false;
    try {
        int* missing = nullptr;
        (void)checkPointer(missing, &fakeRegister);
    } catch (const SlurmError& e) {
        thrown = true;
        assert(e.kind() == ErrorKind::DatabaseConnection);
    }
    assert(thrown);
    assert(g_reads == 1);

    std::cout << "✓ Null results throw, non-null results pass through" << std::endl;
}

void test_error_chain() {
    std::cout << "Testing nested error chains..." << std::endl;

    try {
        try {
            try {
                throw SlurmError::fromCode(ESLURM_INVALID_JOB_ID);
            } catch (const SlurmError&) {
                std::throw_with_nested(std::runtime_error("failed to load job 42"));
            }
        } catch (const std::exception&) {
            std::throw_with_nested(std::runtime_error("status command failed"));
        }
    } catch (const std::exception& e) {
        auto chain = describeErrorChain(e);
        assert(chain.size() == 3);
        assert(chain[0] == "status command failed");
        assert(chain[1] == "failed to load job 42");
        assert(endsWith(chain[2], "(Slurm errno " + std::to_string(ESLURM_INVALID_JOB_ID) + ")"));
    }

    std::runtime_error plain("single");
    auto chain = describeErrorChain(plain);
    assert(chain.size() == 1);
    assert(chain[0] == "single");

    try {
        try {
            throw 17;
        } catch (int) {
            std::throw_with_nested(std::runtime_error("wrapper"));
        }
    } catch (const std::exception& e) {
        auto odd = describeErrorChain(e);
        assert(odd.size() == 2);
        assert(odd[1] == "unknown error");
    }

    std::cout << "✓ Chains list the outer error first, then each cause" << std::endl;
}

void test_lossy_text() {
    std::cout << "Testing lossy UTF-8 decoding..." << std::endl;

    const char* nothing = nullptr;
    assert(lossyText(nothing).empty());
    assert(lossyText("plain ascii") == "plain ascii");
    assert(lossyText("caf\xC3\xA9") == "caf\xC3\xA9");

    // One replacement character per maximal invalid subpart.
    const std::string fffd = "\xEF\xBF\xBD";
    assert(lossyText(std::string_view("a\xFF" "b")) == "a" + fffd + "b");
    assert(lossyText(std::string_view("\xC3")) == fffd);
    assert(lossyText(std::string_view("a\xE2\x82z")) == "a" + fffd + "z");
    assert(lossyText(std::string_view("\xF0\x9F\x98")) == fffd);
    assert(lossyText(std::string_view("\xF0\x9F\x98!")) == fffd + "!");
    assert(lossyText(std::string_view("\xE2\x82\xE2\x82\xAC")) == fffd + "\xE2\x82\xAC");
    // Bytes that can never start or continue the sequence stand alone.
    assert(lossyText(std::string_view("\xC0\xAF")) == fffd + fffd);
    assert(lossyText(std::string_view("\xED\xA0\x80")) == fffd + fffd + fffd);

    assert(isValidUtf8("caf\xC3\xA9"));
    assert(isValidUtf8(""));
    assert(!isValidUtf8("\xFF"));
    assert(!isValidUtf8("\xC0\xAF"));
    assert(!isValidUtf8("\xE2\x82"));

    std::cout << "✓ Invalid bytes become U+FFFD and valid text is untouched" << std::endl;
}

int main() {
    std::cout << "\n=== Error Mapping Test Suite ===" << std::endl;

    Logger::setLevel(LogLevel::ERROR);

    test_known_codes_map_to_kinds();
    test_unknown_code_keeps_number();
    test_check_status_success_skips_register();
    test_check_status_failure_reads_register();
    test_check_returned_code();
    test_check_pointer();
    test_error_chain();
    test_lossy_text();

    std::cout << "\n✅ All error mapping tests passed!" << std::endl;
    return 0;
}
