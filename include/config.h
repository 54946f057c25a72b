#pragma once

#include "core/constants.h"
#include "errors.h"
#include <string>
#include <vector>

namespace helios {

/// Remote model and session negotiation
struct ApiConfig {
    std::string endpoint = "wss://generativelanguage.googleapis.com/ws/"
                           "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";
    std::string model = "gemini-2.5-flash-native-audio-preview-12-2025";
    std::string voice = "Zephyr";
    std::string system_instruction =
        "You are \"Helios,\" a Master Field Engineer Agent. "
        "MISSION: Real-time complex mechanical/electronic repairs using multimodal vision and low-latency reasoning. "
        "PHASE 1 (ID): Identify object/make/model. "
        "PHASE 2 (SAFETY): MANDATORY safety warning first. Mention specifically if you see capacitors or exposed wiring. "
        "PHASE 3 (DIAG): Guide user to move camera for better angles. "
        "PHASE 4 (GUIDANCE): Numbered, technical instructions. Use spatial terms and specify torque requirements. "
        "PHASE 5 (VERIFY): Visually verify work before next steps. "
        "TONE: Professional, urgent, calm, highly technical. No fluff.";
    int connect_timeout_ms = constants::channel::CONNECT_TIMEOUT_MS;
    /// Read from API_KEY / GEMINI_API_KEY; never written by save_to_file
    std::string api_key;
};

struct AudioConfig {
    std::string input_device = "default";
    std::string output_device = "default";
    int input_sample_rate = constants::audio::INPUT_SAMPLE_RATE;
    int output_sample_rate = constants::audio::OUTPUT_SAMPLE_RATE;
    int capture_quantum = constants::audio::CAPTURE_QUANTUM;

    /// MIME type tagging outbound audio, e.g. "audio/pcm;rate=16000"
    std::string input_mime_type() const {
        return "audio/pcm;rate=" + std::to_string(input_sample_rate);
    }
};

struct VideoConfig {
    std::string source = "test_pattern";  ///< "none" | "test_pattern" | "v4l2"
    std::string device = "/dev/video0";   ///< Camera node when source is "v4l2"
    int source_width = 1920;              ///< Raster produced by the local source
    int source_height = 1080;
    int frame_rate_hz = constants::video::FRAME_RATE_HZ;
    int width = constants::video::FRAME_WIDTH;     ///< Transmitted raster
    int height = constants::video::FRAME_HEIGHT;
    float jpeg_quality = constants::video::JPEG_QUALITY;
};

struct SessionConfig {
    size_t transcript_cap = constants::session::TRANSCRIPT_CAP;
};

struct ToolsConfig {
    std::vector<std::string> enabled = {"get_repair_manual", "check_parts_inventory"};
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;  ///< Empty = console only
};

struct Config {
    ApiConfig api;
    AudioConfig audio;
    VideoConfig video;
    SessionConfig session;
    ToolsConfig tools;
    LoggingConfig logging;

    /**
     * @brief Load from a JSON file; missing fields keep their defaults.
     * Unreadable or malformed files log a warning and yield defaults. The API
     * key is taken from the environment afterwards.
     */
    static Config load_from_file(const std::string& path);

    void save_to_file(const std::string& path) const;

    /// Override api_key from API_KEY or GEMINI_API_KEY when set
    void apply_environment();

    /// ConfigError for a missing API key or non-positive rates and sizes
    Result<void> validate() const;
};

} // namespace helios
