#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>

namespace helios {

// Audio types
using Sample = int16_t;
using PcmBuffer = std::vector<Sample>;
using Bytes = std::vector<uint8_t>;

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

/// Wall-clock milliseconds since the epoch (transcript timestamps)
inline int64_t wall_clock_ms() {
    return std::chrono::duration_cast<Duration>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * @brief One encoded outbound media payload (audio quantum or video frame)
 */
struct MediaChunk {
    std::string data;       ///< base64 payload
    std::string mime_type;  ///< e.g. "audio/pcm;rate=16000", "image/jpeg"
};

} // namespace helios
