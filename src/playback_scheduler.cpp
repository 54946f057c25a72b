#include "playback_scheduler.h"
#include "logger.h"
#include <algorithm>

namespace helios {

PlaybackScheduler::PlaybackScheduler(AudioSink& sink, int sample_rate, int channels)
    : sink_(sink), sample_rate_(sample_rate), channels_(channels) {}

Result<ScheduledSource> PlaybackScheduler::enqueue(const std::string& encoded) {
    auto bytes = codec::decode_bytes(encoded);
    if (bytes.is_error()) {
        return bytes.error();
    }

    auto buffer = codec::decode_audio_samples(bytes.value(), sample_rate_, channels_);
    if (buffer.is_error()) {
        return buffer.error();
    }

    return schedule(buffer.value());
}

ScheduledSource PlaybackScheduler::schedule(const PlayableBuffer& buffer) {
    next_start_time_ = std::max(next_start_time_, sink_.current_time());

    ScheduledSource placed;
    placed.start_time = next_start_time_;
    placed.duration = buffer.duration();
    placed.id = sink_.start_source(buffer, placed.start_time);

    active_.insert(placed.id);
    next_start_time_ += placed.duration;

    LOG_PLAYBACK("Scheduled source " + std::to_string(placed.id) + " at " +
                 std::to_string(placed.start_time) + "s for " + std::to_string(placed.duration) + "s");
    return placed;
}

size_t PlaybackScheduler::reap_finished() {
    size_t removed = 0;
    for (SourceId id : sink_.take_finished()) {
        removed += active_.erase(id);
    }
    return removed;
}

void PlaybackScheduler::interrupt() {
    LOG_PLAYBACK("Interrupted with " + std::to_string(active_.size()) + " active sources");
    stop_active();
}

void PlaybackScheduler::stop_all() {
    stop_active();
}

double PlaybackScheduler::buffered_seconds() const {
    if (active_.empty()) return 0.0;
    return std::max(0.0, next_start_time_ - sink_.current_time());
}

void PlaybackScheduler::stop_active() {
    for (SourceId id : active_) {
        sink_.stop_source(id);
    }
    active_.clear();
    next_start_time_ = 0.0;
}

} // namespace helios
