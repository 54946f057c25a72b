#include "voice_mixer.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace helios {

VoiceMixer::VoiceMixer(int sample_rate)
    : sample_rate_(sample_rate > 0 ? sample_rate : constants::audio::OUTPUT_SAMPLE_RATE) {}

void VoiceMixer::reset(int sample_rate) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sample_rate > 0) sample_rate_ = sample_rate;
    voices_.clear();
    finished_.clear();
    frames_rendered_ = 0;
}

double VoiceMixer::current_time() const {
    return static_cast<double>(frames_rendered_.load()) / sample_rate_;
}

SourceId VoiceMixer::start_source(const PlayableBuffer& buffer, double when) {
    Voice voice;
    voice.samples = mixdown(buffer);

    std::lock_guard<std::mutex> lock(mutex_);
    voice.id = next_id_++;
    voice.start_frame = static_cast<int64_t>(std::llround(when * sample_rate_));

    const int64_t rendered = frames_rendered_.load();
    if (voice.start_frame < rendered) {
        LOG_PLAYBACK("Source " + std::to_string(voice.id) + " late by " +
                     std::to_string(rendered - voice.start_frame) + " frames; head skipped");
    }

    voices_.push_back(std::move(voice));
    return voices_.back().id;
}

void VoiceMixer::stop_source(SourceId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    voices_.remove_if([id](const Voice& v) { return v.id == id; });
}

std::vector<SourceId> VoiceMixer::take_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SourceId> done;
    done.swap(finished_);
    return done;
}

size_t VoiceMixer::voice_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return voices_.size();
}

void VoiceMixer::render(float* out, size_t frame_count) {
    std::memset(out, 0, frame_count * sizeof(float));

    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t block_start = frames_rendered_.load();
    const int64_t block_end = block_start + static_cast<int64_t>(frame_count);

    for (auto it = voices_.begin(); it != voices_.end();) {
        const int64_t voice_end = it->start_frame + static_cast<int64_t>(it->samples.size());
        const int64_t from = std::max(block_start, it->start_frame);
        const int64_t to = std::min(block_end, voice_end);
        for (int64_t f = from; f < to; ++f) {
            out[f - block_start] += it->samples[static_cast<size_t>(f - it->start_frame)];
        }
        if (voice_end <= block_end) {
            finished_.push_back(it->id);
            it = voices_.erase(it);
        } else {
            ++it;
        }
    }

    for (size_t i = 0; i < frame_count; ++i) {
        out[i] = std::min(1.0f, std::max(-1.0f, out[i]));
    }

    frames_rendered_ = block_end;
}

std::vector<float> VoiceMixer::mixdown(const PlayableBuffer& buffer) {
    if (buffer.channel_data.empty()) return {};
    if (buffer.channel_data.size() == 1) return buffer.channel_data[0];

    std::vector<float> mono(buffer.frames(), 0.0f);
    const float scale = 1.0f / static_cast<float>(buffer.channel_data.size());
    for (const auto& channel : buffer.channel_data) {
        for (size_t i = 0; i < mono.size() && i < channel.size(); ++i) {
            mono[i] += channel[i] * scale;
        }
    }
    return mono;
}

} // namespace helios
