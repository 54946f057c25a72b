/**
 * Gapless playback scheduling.
 * Asserts:
 * - chunks are placed back to back on the output clock, never in the past.
 * - interrupt() stops everything and resets the timeline to 0.
 * - malformed chunks are DecodeError and leave the schedule untouched.
 *
 * Run from build dir: ./test_playback_scheduler
 * No audio hardware required.
 */

#include "playback_scheduler.h"
#include "fakes.h"
#include <cmath>
#include <iostream>

using namespace helios;
using helios::testing::FakeAudioSink;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

/// base64 of `frames` silent mono int16 samples
static std::string silent_chunk(size_t frames) {
    return codec::encode_bytes(Bytes(frames * 2, 0));
}

int main() {
    // --- back-to-back placement ---
    {
        FakeAudioSink sink;
        PlaybackScheduler playback(sink, 24000, 1);
        ASSERT(playback.next_start_time() == 0.0);

        auto a = playback.enqueue(silent_chunk(12000));  // 0.5 s
        auto b = playback.enqueue(silent_chunk(24000));  // 1.0 s
        ASSERT(a.is_ok() && b.is_ok());
        ASSERT(near(a.value().start_time, 0.0));
        ASSERT(near(a.value().duration, 0.5));
        ASSERT(near(b.value().start_time, 0.5));
        ASSERT(near(playback.next_start_time(), 1.5));
        ASSERT(playback.active_count() == 2);
        ASSERT(sink.started.size() == 2);
        ASSERT(near(sink.started[1].when, 0.5));
        ASSERT(sink.started[1].frames == 24000);
    }

    // --- timeline catches up with the clock after a gap ---
    {
        FakeAudioSink sink;
        PlaybackScheduler playback(sink);
        ASSERT(playback.enqueue(silent_chunk(2400)).is_ok());  // ends at 0.1
        sink.now = 3.0;
        auto late = playback.enqueue(silent_chunk(2400));
        ASSERT(late.is_ok());
        ASSERT(near(late.value().start_time, 3.0));
        ASSERT(near(playback.next_start_time(), 3.1));
    }

    // --- starts never precede the clock and never overlap ---
    {
        FakeAudioSink sink;
        PlaybackScheduler playback(sink);
        double prev_end = 0.0;
        for (int i = 0; i < 20; ++i) {
            sink.now = i * 0.03;
            auto placed = playback.enqueue(silent_chunk(480 + i * 10));
            ASSERT(placed.is_ok());
            ASSERT(placed.value().start_time >= sink.now);
            ASSERT(placed.value().start_time >= prev_end - 1e-12);
            prev_end = placed.value().start_time + placed.value().duration;
        }
    }

    // --- reap_finished only drops sources the device completed ---
    {
        FakeAudioSink sink;
        PlaybackScheduler playback(sink);
        auto a = playback.enqueue(silent_chunk(240));
        auto b = playback.enqueue(silent_chunk(240));
        ASSERT(a.is_ok() && b.is_ok());
        sink.finish(a.value().id);
        ASSERT(playback.reap_finished() == 1);
        ASSERT(!playback.is_active(a.value().id));
        ASSERT(playback.is_active(b.value().id));
        ASSERT(playback.reap_finished() == 0);
    }

    // --- interrupt ---
    {
        FakeAudioSink sink;
        PlaybackScheduler playback(sink);
        sink.now = 1.0;
        for (int i = 0; i < 3; ++i) {
            ASSERT(playback.enqueue(silent_chunk(24000)).is_ok());
        }
        ASSERT(near(playback.buffered_seconds(), 3.0));

        playback.interrupt();
        ASSERT(playback.active_count() == 0);
        ASSERT(sink.stopped.size() == 3);
        ASSERT(sink.playing.empty());
        ASSERT(playback.next_start_time() == 0.0);
        ASSERT(playback.buffered_seconds() == 0.0);

        // Next chunk starts at the current clock, not at 0
        sink.now = 1.25;
        auto after = playback.enqueue(silent_chunk(240));
        ASSERT(after.is_ok());
        ASSERT(near(after.value().start_time, 1.25));

        playback.interrupt();
        playback.interrupt();  // idempotent
        ASSERT(playback.active_count() == 0);
    }

    // --- decode failures leave state untouched ---
    {
        FakeAudioSink sink;
        PlaybackScheduler playback(sink);
        ASSERT(playback.enqueue(silent_chunk(2400)).is_ok());
        double before = playback.next_start_time();

        auto bad_text = playback.enqueue("not*base64");
        ASSERT(bad_text.is_error());
        ASSERT(bad_text.error().type == ErrorType::DecodeError);

        auto odd_length = playback.enqueue(codec::encode_bytes(Bytes{1, 2, 3}));
        ASSERT(odd_length.is_error());

        auto empty = playback.enqueue("");
        ASSERT(empty.is_error());

        ASSERT(playback.next_start_time() == before);
        ASSERT(playback.active_count() == 1);
        ASSERT(sink.started.size() == 1);
    }

    // --- stop_all ---
    {
        FakeAudioSink sink;
        PlaybackScheduler playback(sink);
        ASSERT(playback.enqueue(silent_chunk(2400)).is_ok());
        playback.stop_all();
        ASSERT(playback.active_count() == 0);
        ASSERT(playback.next_start_time() == 0.0);
        ASSERT(sink.stopped.size() == 1);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All playback scheduler tests passed.\n";
    return 0;
}
