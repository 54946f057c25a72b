#pragma once

#include "common.h"
#include "config.h"
#include "tool.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace helios {

/**
 * @brief Everything a single server message carries that the session acts on
 *
 * One message may carry several of these at once; the session processes
 * them in field order.
 */
struct ServerMessage {
    bool setup_complete = false;
    std::vector<std::string> audio_chunks;           ///< base64 PCM payloads
    std::optional<std::string> input_transcription;  ///< What the user said
    std::optional<std::string> output_transcription; ///< What the model said
    std::vector<ToolCall> tool_calls;
    bool interrupted = false;
    bool turn_complete = false;
    bool go_away = false;
};

/**
 * @brief JSON wire format of the Live bidirectional session
 */
namespace protocol {

/**
 * @brief First client message: model, voice, persona, tools, transcription
 */
nlohmann::json build_setup_message(const ApiConfig& api, const nlohmann::json& function_declarations);

nlohmann::json build_media_message(const MediaChunk& chunk);

nlohmann::json build_tool_response(const FunctionResponse& response);

/**
 * @brief Classify one inbound text frame
 * @return ParseError for invalid JSON or a non-object root
 */
Result<ServerMessage> parse_server_message(const std::string& text);

} // namespace protocol

} // namespace helios
