/**
 * Frame-accurate output mixing.
 * Asserts:
 * - sources play at their scheduled frame; a source scheduled in the past keeps its
 *   place and the next one starts exactly where it ends (no overlap).
 * - natural completion is reported once; stopped sources are not reported.
 * - multi-channel buffers are mixed down; the output is clamped to [-1, 1].
 *
 * Run from build dir: ./test_voice_mixer
 * No audio hardware required.
 */

#include "voice_mixer.h"
#include "logger.h"
#include <iostream>
#include <vector>

using namespace helios;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static PlayableBuffer constant(size_t frames, float value, int channels = 1) {
    PlayableBuffer buffer;
    buffer.sample_rate = 1000;
    buffer.channels = channels;
    buffer.channel_data.assign(channels, std::vector<float>(frames, value));
    return buffer;
}

int main() {
    Logger::initialize(LogLevel::ERROR);
    std::vector<float> out(100);

    // --- clock ---
    VoiceMixer mixer(1000);
    ASSERT(mixer.current_time() == 0.0);
    mixer.render(out.data(), out.size());
    ASSERT(mixer.frames_rendered() == 100);
    ASSERT(mixer.current_time() == 0.1);
    ASSERT(out[0] == 0.0f && out[99] == 0.0f);

    // --- late source keeps its timeline slot ---
    SourceId late = mixer.start_source(constant(100, 0.25f), 0.05);   // frames 50..149
    SourceId next = mixer.start_source(constant(100, 0.5f), 0.15);    // frames 150..249
    ASSERT(late != next);
    ASSERT(mixer.voice_count() == 2);

    mixer.render(out.data(), out.size());                             // frames 100..199
    ASSERT(out[0] == 0.25f);
    ASSERT(out[49] == 0.25f);
    ASSERT(out[50] == 0.5f);
    ASSERT(out[99] == 0.5f);
    bool overlapped = false;
    for (float v : out) {
        if (v > 0.5f) overlapped = true;
    }
    ASSERT(!overlapped);

    auto done = mixer.take_finished();
    ASSERT(done.size() == 1 && done[0] == late);
    ASSERT(mixer.take_finished().empty());

    mixer.render(out.data(), out.size());                             // frames 200..299
    ASSERT(out[49] == 0.5f);
    ASSERT(out[50] == 0.0f);
    done = mixer.take_finished();
    ASSERT(done.size() == 1 && done[0] == next);
    ASSERT(mixer.voice_count() == 0);

    // --- future start and stop ---
    SourceId future = mixer.start_source(constant(50, 0.1f), 0.35);   // frames 350..399
    mixer.render(out.data(), out.size());                             // frames 300..399
    ASSERT(out[49] == 0.0f);
    ASSERT(out[50] == 0.1f);
    ASSERT(mixer.take_finished().size() == 1);

    SourceId stopped = mixer.start_source(constant(500, 0.2f), 0.4);
    mixer.render(out.data(), out.size());
    ASSERT(out[0] == 0.2f);
    mixer.stop_source(stopped);
    mixer.render(out.data(), out.size());
    ASSERT(out[0] == 0.0f);
    ASSERT(mixer.take_finished().empty());
    (void)future;

    // --- mixdown and clamp ---
    VoiceMixer loud(1000);
    PlayableBuffer stereo = constant(100, 0.0f, 2);
    for (auto& s : stereo.channel_data[0]) s = 0.8f;
    loud.start_source(stereo, 0.0);                                   // mono 0.4
    loud.render(out.data(), out.size());
    ASSERT(out[10] > 0.39f && out[10] < 0.41f);

    loud.start_source(constant(100, 0.75f), 0.1);
    loud.start_source(constant(100, 0.75f), 0.1);
    loud.start_source(constant(100, -0.75f), 0.2);
    loud.start_source(constant(100, -0.75f), 0.2);
    loud.render(out.data(), out.size());
    ASSERT(out[0] == 1.0f);
    loud.render(out.data(), out.size());
    ASSERT(out[0] == -1.0f);

    // --- reset ---
    loud.start_source(constant(100, 0.3f), 1.0);
    loud.reset(2000);
    ASSERT(loud.voice_count() == 0);
    ASSERT(loud.current_time() == 0.0);
    ASSERT(loud.take_finished().empty());
    loud.render(out.data(), out.size());
    ASSERT(loud.current_time() == 0.05);

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All voice mixer tests passed.\n";
    return 0;
}
