#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace helios {

namespace {

void read_string(const json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string()) out = obj[key].get<std::string>();
}

void read_int(const json& obj, const char* key, int& out) {
    if (obj.contains(key) && obj[key].is_number_integer()) out = obj[key].get<int>();
}

/// Apply full JSON config (all sections) into cfg.
void apply_json_to_config(Config& cfg, const json& j) {
    if (j.contains("api") && j["api"].is_object()) {
        const auto& a = j["api"];
        read_string(a, "endpoint", cfg.api.endpoint);
        read_string(a, "model", cfg.api.model);
        read_string(a, "voice", cfg.api.voice);
        read_string(a, "system_instruction", cfg.api.system_instruction);
        read_int(a, "connect_timeout_ms", cfg.api.connect_timeout_ms);
    }

    if (j.contains("audio") && j["audio"].is_object()) {
        const auto& a = j["audio"];
        read_string(a, "input_device", cfg.audio.input_device);
        read_string(a, "output_device", cfg.audio.output_device);
        read_int(a, "input_sample_rate", cfg.audio.input_sample_rate);
        read_int(a, "output_sample_rate", cfg.audio.output_sample_rate);
        read_int(a, "capture_quantum", cfg.audio.capture_quantum);
    }

    if (j.contains("video") && j["video"].is_object()) {
        const auto& v = j["video"];
        read_string(v, "source", cfg.video.source);
        read_string(v, "device", cfg.video.device);
        read_int(v, "source_width", cfg.video.source_width);
        read_int(v, "source_height", cfg.video.source_height);
        read_int(v, "frame_rate_hz", cfg.video.frame_rate_hz);
        read_int(v, "width", cfg.video.width);
        read_int(v, "height", cfg.video.height);
        if (v.contains("jpeg_quality") && v["jpeg_quality"].is_number())
            cfg.video.jpeg_quality = v["jpeg_quality"].get<float>();
    }

    if (j.contains("session") && j["session"].is_object()) {
        const auto& s = j["session"];
        if (s.contains("transcript_cap") && s["transcript_cap"].is_number_unsigned())
            cfg.session.transcript_cap = s["transcript_cap"].get<size_t>();
    }

    if (j.contains("tools") && j["tools"].is_object()) {
        const auto& t = j["tools"];
        if (t.contains("enabled") && t["enabled"].is_array()) {
            cfg.tools.enabled.clear();
            for (const auto& name : t["enabled"])
                if (name.is_string()) cfg.tools.enabled.push_back(name.get<std::string>());
        }
    }

    if (j.contains("logging") && j["logging"].is_object()) {
        const auto& l = j["logging"];
        read_string(l, "level", cfg.logging.level);
        read_string(l, "file", cfg.logging.file);
    }
}

} // namespace

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
    } else {
        json j;
        try {
            file >> j;
            apply_json_to_config(cfg, j);
        } catch (const json::exception& e) {
            Logger::error("Error parsing config JSON: " + std::string(e.what()));
        }
    }

    if (!cfg.logging.file.empty()) cfg.logging.file = expand_path(cfg.logging.file);
    cfg.apply_environment();
    return cfg;
}

void Config::apply_environment() {
    const char* key = std::getenv("API_KEY");
    if (!key || !*key) key = std::getenv("GEMINI_API_KEY");
    if (key && *key) {
        api.api_key = key;
    }
}

Result<void> Config::validate() const {
    if (api.api_key.empty()) {
        return make_config_error("Missing API key: set API_KEY or GEMINI_API_KEY");
    }
    if (api.endpoint.empty() || api.model.empty()) {
        return make_config_error("api.endpoint and api.model must be set");
    }
    if (audio.input_sample_rate <= 0 || audio.output_sample_rate <= 0 || audio.capture_quantum <= 0) {
        return make_config_error("audio rates and capture_quantum must be positive");
    }
    if (video.frame_rate_hz <= 0 || video.width <= 0 || video.height <= 0) {
        return make_config_error("video frame_rate_hz, width and height must be positive");
    }
    if (video.frame_rate_hz > constants::video::MAX_FRAME_RATE_HZ) {
        return make_config_error("video.frame_rate_hz must not exceed " +
                                 std::to_string(constants::video::MAX_FRAME_RATE_HZ));
    }
    if (video.jpeg_quality <= 0.0f || video.jpeg_quality > 1.0f) {
        return make_config_error("video.jpeg_quality must be in (0, 1]");
    }
    if (session.transcript_cap == 0) {
        return make_config_error("session.transcript_cap must be positive");
    }
    return {};
}

void Config::save_to_file(const std::string& path) const {
    json j;

    j["api"]["endpoint"] = api.endpoint;
    j["api"]["model"] = api.model;
    j["api"]["voice"] = api.voice;
    j["api"]["system_instruction"] = api.system_instruction;
    j["api"]["connect_timeout_ms"] = api.connect_timeout_ms;

    j["audio"]["input_device"] = audio.input_device;
    j["audio"]["output_device"] = audio.output_device;
    j["audio"]["input_sample_rate"] = audio.input_sample_rate;
    j["audio"]["output_sample_rate"] = audio.output_sample_rate;
    j["audio"]["capture_quantum"] = audio.capture_quantum;

    j["video"]["source"] = video.source;
    j["video"]["device"] = video.device;
    j["video"]["source_width"] = video.source_width;
    j["video"]["source_height"] = video.source_height;
    j["video"]["frame_rate_hz"] = video.frame_rate_hz;
    j["video"]["width"] = video.width;
    j["video"]["height"] = video.height;
    j["video"]["jpeg_quality"] = video.jpeg_quality;

    j["session"]["transcript_cap"] = session.transcript_cap;

    j["tools"]["enabled"] = tools.enabled;

    j["logging"]["level"] = logging.level;
    j["logging"]["file"] = logging.file;

    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Could not write config file: " + path);
        return;
    }
    file << j.dump(2);
}

} // namespace helios
