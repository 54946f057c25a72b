#pragma once

/**
 * @file constants.h
 * @brief Fixed rates, cadences and limits of the realtime session
 *
 * Defaults for the matching Config fields. Components take their values
 * from Config at construction; these are only the fallbacks.
 */

#include <cstddef>

namespace helios {
namespace constants {

// =============================================================================
// Audio
// =============================================================================

namespace audio {
    /// Microphone capture rate (Hz)
    constexpr int INPUT_SAMPLE_RATE = 16000;

    /// Rate of synthesized speech received from the model (Hz)
    constexpr int OUTPUT_SAMPLE_RATE = 24000;

    /// Inbound audio is mono
    constexpr int OUTPUT_CHANNELS = 1;

    /// Samples per hardware capture quantum
    constexpr int CAPTURE_QUANTUM = 4096;

    /// Normalization factor between float and int16 PCM
    constexpr double PCM_SCALE = 32768.0;

    /// Captured quanta kept while the event loop is busy (oldest dropped)
    constexpr size_t MAX_PENDING_QUANTA = 100;
}

// =============================================================================
// Video
// =============================================================================

namespace video {
    /// Outbound frame cadence (Hz)
    constexpr int FRAME_RATE_HZ = 2;

    /// Frame timer resolution is 1 ms
    constexpr int MAX_FRAME_RATE_HZ = 1000;

    /// Transmitted raster
    constexpr int FRAME_WIDTH = 640;
    constexpr int FRAME_HEIGHT = 360;

    /// JPEG quality factor (0-1)
    constexpr float JPEG_QUALITY = 0.6f;

    constexpr const char* MIME_TYPE = "image/jpeg";
}

// =============================================================================
// Session
// =============================================================================

namespace session {
    /// Transcript entries retained (oldest evicted)
    constexpr size_t TRANSCRIPT_CAP = 50;

    /// Event loop sleep when there is nothing to do (ms)
    constexpr int IDLE_SLEEP_MS = 5;

    /// Smoothing factor for the load gauge
    constexpr double LOAD_SMOOTHING = 0.1;
}

// =============================================================================
// Channel
// =============================================================================

namespace channel {
    /// WebSocket handshake timeout (ms)
    constexpr int CONNECT_TIMEOUT_MS = 10000;

    /// Receive buffer per curl_ws_recv call
    constexpr size_t RECV_BUFFER_BYTES = 64 * 1024;

    /// Upper bound of frames handled per poll so sends are not starved
    constexpr int MAX_FRAMES_PER_POLL = 64;
}

// =============================================================================
// Tools
// =============================================================================

namespace tools {
    /// Result returned for a function name with no registered handler
    constexpr const char* INVALID_CALL_RESULT = "Error: Invalid Call";
}

} // namespace constants
} // namespace helios
