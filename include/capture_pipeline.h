#pragma once

#include "config.h"
#include "media_source.h"
#include <functional>

namespace helios {

/// Receives every encoded outbound chunk
using OutboundSink = std::function<void(const MediaChunk&)>;

/**
 * @brief Turns live microphone and video input into outbound media chunks
 *
 * Audio is forwarded one capture quantum at a time as 16-bit PCM. Video is
 * sampled on a fixed timer, scaled down and JPEG-compressed. Both are
 * driven from pump(), so all sends happen on the caller's thread.
 */
class CapturePipeline {
public:
    /**
     * @param video Optional; frames are only sent when a source is present
     */
    CapturePipeline(const AudioConfig& audio, const VideoConfig& video,
                    MicrophoneSource& microphone, VideoSource* video_source);
    ~CapturePipeline();

    CapturePipeline(const CapturePipeline&) = delete;
    CapturePipeline& operator=(const CapturePipeline&) = delete;

    /**
     * @brief Start the microphone and video source and arm the frame timer
     *
     * The first frame tick is due one period after `now`.
     * @return ConnectError if a source fails to start; nothing stays running
     */
    Result<void> activate(OutboundSink sink, TimePoint now);

    /**
     * @brief Stop timer and sources; safe to call when inactive
     */
    void deactivate();

    /**
     * @brief Drain queued microphone quanta and fire an overdue frame tick
     */
    void pump(TimePoint now);

    void on_audio_quantum(const std::vector<float>& samples);
    void on_frame_tick();

    void set_muted(bool muted) { muted_ = muted; }
    bool muted() const { return muted_; }
    bool active() const { return active_; }
    bool timer_active() const { return timer_active_; }

    uint64_t audio_chunks_sent() const { return audio_chunks_sent_; }
    uint64_t frames_sent() const { return frames_sent_; }

private:
    AudioConfig audio_config_;
    VideoConfig video_config_;
    MicrophoneSource& microphone_;
    VideoSource* video_;
    OutboundSink sink_;

    bool active_ = false;
    bool muted_ = false;
    bool timer_active_ = false;
    Duration frame_period_;
    TimePoint next_frame_due_;

    uint64_t audio_chunks_sent_ = 0;
    uint64_t frames_sent_ = 0;
};

} // namespace helios
