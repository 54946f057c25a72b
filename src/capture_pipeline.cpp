#include "capture_pipeline.h"
#include "codec.h"
#include "logger.h"
#include <algorithm>

namespace helios {

CapturePipeline::CapturePipeline(const AudioConfig& audio, const VideoConfig& video,
                                 MicrophoneSource& microphone, VideoSource* video_source)
    : audio_config_(audio),
      video_config_(video),
      microphone_(microphone),
      video_(video_source),
      frame_period_(std::max(1, 1000 / (video.frame_rate_hz > 0 ? video.frame_rate_hz
                                                                : constants::video::FRAME_RATE_HZ))) {}

CapturePipeline::~CapturePipeline() {
    deactivate();
}

Result<void> CapturePipeline::activate(OutboundSink sink, TimePoint now) {
    if (active_) {
        return Error(ErrorType::InvalidState, "capture already active");
    }

    auto mic = microphone_.start();
    if (mic.is_error()) {
        return make_connect_error("microphone: " + mic.error().message);
    }

    if (video_) {
        auto cam = video_->start();
        if (cam.is_error()) {
            microphone_.stop();
            return make_connect_error("video: " + cam.error().message);
        }
    }

    sink_ = std::move(sink);
    active_ = true;
    timer_active_ = video_ != nullptr;
    next_frame_due_ = now + frame_period_;

    LOG_CAPTURE("Capture active (" + audio_config_.input_mime_type() + ", " +
                std::to_string(video_config_.width) + "x" + std::to_string(video_config_.height) +
                " @ " + std::to_string(frame_period_.count()) + "ms)");
    return {};
}

void CapturePipeline::deactivate() {
    if (!active_) return;

    timer_active_ = false;
    active_ = false;
    microphone_.stop();
    if (video_) {
        video_->stop();
    }
    sink_ = nullptr;

    LOG_CAPTURE("Capture stopped after " + std::to_string(audio_chunks_sent_) + " audio chunks, " +
                std::to_string(frames_sent_) + " frames");
}

void CapturePipeline::pump(TimePoint now) {
    if (!active_) return;

    std::vector<float> quantum;
    while (active_ && microphone_.read_quantum(quantum)) {
        on_audio_quantum(quantum);
    }

    if (timer_active_ && now >= next_frame_due_) {
        on_frame_tick();
        // Missed periods collapse into the single tick above
        while (next_frame_due_ <= now) {
            next_frame_due_ += frame_period_;
        }
    }
}

void CapturePipeline::on_audio_quantum(const std::vector<float>& samples) {
    if (!active_ || muted_ || samples.empty()) return;

    PcmBuffer pcm = codec::float_to_int16_pcm(samples);
    MediaChunk chunk;
    chunk.data = codec::encode_bytes(codec::pcm_to_bytes(pcm));
    chunk.mime_type = audio_config_.input_mime_type();

    ++audio_chunks_sent_;
    sink_(chunk);
}

void CapturePipeline::on_frame_tick() {
    if (!active_ || !video_) return;

    RgbImage frame;
    if (!video_->latest_frame(frame)) {
        return;
    }

    RgbImage scaled = image::downsample(frame, video_config_.width, video_config_.height);
    auto jpeg = image::encode_jpeg(scaled, video_config_.jpeg_quality);
    if (jpeg.is_error()) {
        LOG_WARN("Frame skipped: " + jpeg.error().to_string());
        return;
    }

    MediaChunk chunk;
    chunk.data = codec::encode_bytes(jpeg.value());
    chunk.mime_type = constants::video::MIME_TYPE;

    ++frames_sent_;
    sink_(chunk);
}

} // namespace helios
