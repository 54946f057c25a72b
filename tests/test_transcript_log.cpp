/**
 * Bounded transcript history.
 * Asserts:
 * - entries keep insertion order and are stamped with wall-clock time.
 * - the oldest entries are evicted beyond capacity.
 *
 * Run from build dir: ./test_transcript_log
 */

#include "transcript_log.h"
#include "common.h"
#include <iostream>
#include <string>

using namespace helios;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- roles ---
    ASSERT(std::string(role_name(TranscriptRole::User)) == "user");
    ASSERT(std::string(role_name(TranscriptRole::Agent)) == "agent");
    ASSERT(std::string(role_name(TranscriptRole::System)) == "system");

    // --- append ---
    TranscriptLog log;
    ASSERT(log.capacity() == 50);
    ASSERT(log.empty());

    int64_t before = wall_clock_ms();
    const TranscriptEntry& first = log.append(TranscriptRole::User, "what torque?");
    ASSERT(first.text == "what torque?");
    ASSERT(first.role == TranscriptRole::User);
    ASSERT(first.timestamp_ms >= before);
    log.append(TranscriptRole::Agent, "15.5 Nm");
    ASSERT(log.size() == 2);
    ASSERT(log.entries().front().role == TranscriptRole::User);
    ASSERT(log.entries().back().text == "15.5 Nm");

    // --- cap ---
    TranscriptLog capped(50);
    for (int i = 0; i < 51; ++i) {
        capped.append(TranscriptRole::Agent, "line " + std::to_string(i));
    }
    ASSERT(capped.size() == 50);
    ASSERT(capped.entries().front().text == "line 1");
    ASSERT(capped.entries().back().text == "line 50");

    TranscriptLog tiny(3);
    for (int i = 0; i < 10; ++i) {
        tiny.append(TranscriptRole::System, std::to_string(i));
        ASSERT(tiny.size() <= 3);
    }
    ASSERT(tiny.entries()[0].text == "7");
    ASSERT(tiny.entries()[2].text == "9");

    tiny.clear();
    ASSERT(tiny.empty());

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All transcript log tests passed.\n";
    return 0;
}
