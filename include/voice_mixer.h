#pragma once

#include "audio_sink.h"
#include "core/constants.h"
#include <atomic>
#include <list>
#include <mutex>

namespace helios {

/**
 * @brief Frame-accurate mono mixer behind the scheduled output device
 *
 * The clock is the number of frames rendered so far. Each source occupies
 * [start, start + length) on that frame timeline; a source scheduled for a
 * time the device has already rendered keeps its place and loses only the
 * elapsed head, so consecutive sources never overlap.
 *
 * Thread Safety:
 * - render() runs on the device thread
 * - every other method is called from the session loop
 */
class VoiceMixer : public AudioSink {
public:
    explicit VoiceMixer(int sample_rate = constants::audio::OUTPUT_SAMPLE_RATE);

    /**
     * @brief Drop every source and restart the clock at zero
     */
    void reset(int sample_rate);

    double current_time() const override;
    SourceId start_source(const PlayableBuffer& buffer, double when) override;
    void stop_source(SourceId id) override;
    std::vector<SourceId> take_finished() override;

    /**
     * @brief Mix the next frame_count frames into out (overwritten, clamped to [-1, 1])
     */
    void render(float* out, size_t frame_count);

    int64_t frames_rendered() const { return frames_rendered_.load(); }
    size_t voice_count() const;

private:
    struct Voice {
        SourceId id = 0;
        int64_t start_frame = 0;
        std::vector<float> samples;
    };

    static std::vector<float> mixdown(const PlayableBuffer& buffer);

    int sample_rate_;
    std::atomic<int64_t> frames_rendered_{0};
    SourceId next_id_ = 1;

    mutable std::mutex mutex_;
    std::list<Voice> voices_;
    std::vector<SourceId> finished_;
};

} // namespace helios
