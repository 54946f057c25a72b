#include "live_protocol.h"

using json = nlohmann::json;

namespace helios {
namespace protocol {

namespace {

bool is_audio_part(const json& inline_data) {
    if (!inline_data.contains("data") || !inline_data["data"].is_string()) {
        return false;
    }
    auto mime = inline_data.find("mimeType");
    if (mime == inline_data.end() || !mime->is_string()) {
        return true;
    }
    return mime->get<std::string>().rfind("audio/", 0) == 0;
}

std::optional<std::string> transcription_text(const json& content, const char* key) {
    auto it = content.find(key);
    if (it == content.end() || !it->is_object()) {
        return std::nullopt;
    }
    auto text = it->find("text");
    if (text == it->end() || !text->is_string()) {
        return std::nullopt;
    }
    return text->get<std::string>();
}

void classify(const json& root, ServerMessage& msg) {
    msg.setup_complete = root.contains("setupComplete");
    msg.go_away = root.contains("goAway");

    auto content_it = root.find("serverContent");
    if (content_it != root.end() && content_it->is_object()) {
        const json& content = *content_it;

        auto turn = content.find("modelTurn");
        if (turn != content.end() && turn->is_object()) {
            auto parts = turn->find("parts");
            if (parts != turn->end() && parts->is_array()) {
                for (const auto& part : *parts) {
                    auto inline_data = part.find("inlineData");
                    if (inline_data != part.end() && is_audio_part(*inline_data)) {
                        msg.audio_chunks.push_back((*inline_data)["data"].get<std::string>());
                    }
                }
            }
        }

        msg.input_transcription = transcription_text(content, "inputTranscription");
        msg.output_transcription = transcription_text(content, "outputTranscription");
        msg.interrupted = content.value("interrupted", false);
        msg.turn_complete = content.value("turnComplete", false);
    }

    auto tool_call = root.find("toolCall");
    if (tool_call != root.end() && tool_call->is_object()) {
        auto calls = tool_call->find("functionCalls");
        if (calls != tool_call->end() && calls->is_array()) {
            for (const auto& fc : *calls) {
                if (!fc.is_object()) continue;
                ToolCall call;
                call.id = fc.value("id", std::string());
                call.name = fc.value("name", std::string());
                if (fc.contains("args") && fc["args"].is_object()) {
                    call.args = fc["args"];
                }
                msg.tool_calls.push_back(std::move(call));
            }
        }
    }
}

} // namespace

json build_setup_message(const ApiConfig& api, const json& function_declarations) {
    json setup;
    setup["model"] = "models/" + api.model;
    setup["generationConfig"]["responseModalities"] = json::array({"AUDIO"});
    setup["generationConfig"]["speechConfig"]["voiceConfig"]["prebuiltVoiceConfig"]["voiceName"] = api.voice;
    setup["systemInstruction"]["parts"] = json::array({json{{"text", api.system_instruction}}});
    if (function_declarations.is_array() && !function_declarations.empty()) {
        setup["tools"] = json::array({json{{"functionDeclarations", function_declarations}}});
    }
    setup["inputAudioTranscription"] = json::object();
    setup["outputAudioTranscription"] = json::object();

    return json{{"setup", setup}};
}

json build_media_message(const MediaChunk& chunk) {
    json media = {{"mimeType", chunk.mime_type}, {"data", chunk.data}};
    return json{{"realtimeInput", {{"mediaChunks", json::array({media})}}}};
}

json build_tool_response(const FunctionResponse& response) {
    json entry;
    entry["id"] = response.id;
    entry["name"] = response.name;
    entry["response"]["result"] = response.result;
    return json{{"toolResponse", {{"functionResponses", json::array({entry})}}}};
}

Result<ServerMessage> parse_server_message(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::exception& e) {
        return make_parse_error(std::string("server message: ") + e.what());
    }
    if (!root.is_object()) {
        return make_parse_error("server message is not an object");
    }

    ServerMessage msg;
    try {
        classify(root, msg);
    } catch (const json::exception& e) {
        return make_parse_error(std::string("server message fields: ") + e.what());
    }
    return msg;
}

} // namespace protocol
} // namespace helios
