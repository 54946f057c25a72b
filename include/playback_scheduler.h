#pragma once

#include "audio_sink.h"
#include "core/constants.h"
#include <set>
#include <string>

namespace helios {

/**
 * @brief Placement of one chunk on the output timeline
 */
struct ScheduledSource {
    SourceId id = 0;
    double start_time = 0.0;  ///< Output clock seconds
    double duration = 0.0;
};

/**
 * @brief Gapless, in-order scheduling of received audio chunks
 *
 * Each chunk starts exactly where the previous one ends (or now, if the
 * timeline has fallen behind the output clock). Interruption drops
 * everything queued and restarts the timeline.
 */
class PlaybackScheduler {
public:
    explicit PlaybackScheduler(AudioSink& sink,
                               int sample_rate = constants::audio::OUTPUT_SAMPLE_RATE,
                               int channels = constants::audio::OUTPUT_CHANNELS);

    /**
     * @brief Decode a base64 PCM chunk and schedule it
     * @return DecodeError on malformed input; nothing is scheduled in that case
     */
    Result<ScheduledSource> enqueue(const std::string& encoded);

    /**
     * @brief Schedule an already decoded buffer at the end of the timeline
     */
    ScheduledSource schedule(const PlayableBuffer& buffer);

    /**
     * @brief Forget sources the device reports as played to completion
     * @return Number removed
     */
    size_t reap_finished();

    /**
     * @brief Barge-in: stop every active source and reset the timeline
     */
    void interrupt();

    /**
     * @brief Session teardown; same effect as interrupt()
     */
    void stop_all();

    double next_start_time() const { return next_start_time_; }
    size_t active_count() const { return active_.size(); }
    bool is_active(SourceId id) const { return active_.count(id) > 0; }

    /**
     * @brief Audio queued beyond the current output time, in seconds
     */
    double buffered_seconds() const;

private:
    void stop_active();

    AudioSink& sink_;
    int sample_rate_;
    int channels_;
    double next_start_time_ = 0.0;
    std::set<SourceId> active_;
};

} // namespace helios
