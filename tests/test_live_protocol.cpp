/**
 * Live session wire format.
 * Asserts:
 * - setup, media and tool-response messages have the expected JSON shape.
 * - server messages are classified into audio, transcriptions, tool calls,
 *   interruption and control flags; bad JSON is a ParseError.
 *
 * Run from build dir: ./test_live_protocol
 */

#include "live_protocol.h"
#include <iostream>

using namespace helios;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- setup ---
    ApiConfig api;
    api.model = "test-model";
    api.voice = "Zephyr";
    api.system_instruction = "Be brief.";
    json decls = json::array({json{{"name", "check_parts_inventory"}}});

    json setup = protocol::build_setup_message(api, decls);
    ASSERT(setup.contains("setup"));
    const json& s = setup["setup"];
    ASSERT(s["model"] == "models/test-model");
    ASSERT(s["generationConfig"]["responseModalities"] == json::array({"AUDIO"}));
    ASSERT(s["generationConfig"]["speechConfig"]["voiceConfig"]["prebuiltVoiceConfig"]["voiceName"] == "Zephyr");
    ASSERT(s["systemInstruction"]["parts"][0]["text"] == "Be brief.");
    ASSERT(s["tools"][0]["functionDeclarations"][0]["name"] == "check_parts_inventory");
    ASSERT(s["inputAudioTranscription"].is_object());
    ASSERT(s["outputAudioTranscription"].is_object());

    json no_tools = protocol::build_setup_message(api, json::array());
    ASSERT(!no_tools["setup"].contains("tools"));

    // --- media ---
    MediaChunk chunk{"AAAA", "audio/pcm;rate=16000"};
    json media = protocol::build_media_message(chunk);
    ASSERT(media["realtimeInput"]["mediaChunks"].size() == 1);
    ASSERT(media["realtimeInput"]["mediaChunks"][0]["mimeType"] == "audio/pcm;rate=16000");
    ASSERT(media["realtimeInput"]["mediaChunks"][0]["data"] == "AAAA");

    // --- tool response ---
    FunctionResponse fr{"id-1", "check_parts_inventory", "in stock"};
    json tr = protocol::build_tool_response(fr);
    const json& entry = tr["toolResponse"]["functionResponses"][0];
    ASSERT(entry["id"] == "id-1");
    ASSERT(entry["name"] == "check_parts_inventory");
    ASSERT(entry["response"]["result"] == "in stock");

    // --- setupComplete ---
    auto setup_done = protocol::parse_server_message(R"({"setupComplete":{}})");
    ASSERT(setup_done.is_ok());
    ASSERT(setup_done.value().setup_complete);
    ASSERT(setup_done.value().audio_chunks.empty());

    // --- audio parts ---
    auto audio = protocol::parse_server_message(R"({
        "serverContent": {"modelTurn": {"parts": [
            {"inlineData": {"mimeType": "audio/pcm;rate=24000", "data": "AAAA"}},
            {"text": "thinking"},
            {"inlineData": {"data": "BBBB"}},
            {"inlineData": {"mimeType": "image/png", "data": "CCCC"}}
        ]}}
    })");
    ASSERT(audio.is_ok());
    ASSERT(audio.value().audio_chunks.size() == 2);
    ASSERT(audio.value().audio_chunks[0] == "AAAA");
    ASSERT(audio.value().audio_chunks[1] == "BBBB");
    ASSERT(!audio.value().setup_complete);
    ASSERT(!audio.value().interrupted);

    // --- transcriptions and flags ---
    auto mixed = protocol::parse_server_message(R"({
        "serverContent": {
            "inputTranscription": {"text": "check the fan"},
            "outputTranscription": {"text": "Discharge the capacitor first."},
            "interrupted": true,
            "turnComplete": true
        }
    })");
    ASSERT(mixed.is_ok());
    ASSERT(mixed.value().input_transcription.has_value());
    ASSERT(*mixed.value().input_transcription == "check the fan");
    ASSERT(*mixed.value().output_transcription == "Discharge the capacitor first.");
    ASSERT(mixed.value().interrupted);
    ASSERT(mixed.value().turn_complete);

    auto no_text = protocol::parse_server_message(R"({"serverContent":{"inputTranscription":{}}})");
    ASSERT(no_text.is_ok());
    ASSERT(!no_text.value().input_transcription.has_value());

    // --- tool calls ---
    auto calls = protocol::parse_server_message(R"({
        "toolCall": {"functionCalls": [
            {"id": "a", "name": "get_repair_manual", "args": {"model_number": "M1", "component_name": "Relay"}},
            {"id": "b", "name": "check_parts_inventory"}
        ]}
    })");
    ASSERT(calls.is_ok());
    ASSERT(calls.value().tool_calls.size() == 2);
    ASSERT(calls.value().tool_calls[0].id == "a");
    ASSERT(calls.value().tool_calls[0].args["component_name"] == "Relay");
    ASSERT(calls.value().tool_calls[1].name == "check_parts_inventory");
    ASSERT(calls.value().tool_calls[1].args.is_object());
    ASSERT(calls.value().tool_calls[1].args.empty());

    // --- goAway ---
    auto bye = protocol::parse_server_message(R"({"goAway":{"timeLeft":"10s"}})");
    ASSERT(bye.is_ok());
    ASSERT(bye.value().go_away);

    // --- malformed ---
    auto broken = protocol::parse_server_message("{not json");
    ASSERT(broken.is_error());
    ASSERT(broken.error().type == ErrorType::ParseError);
    ASSERT(protocol::parse_server_message("[1,2]").is_error());
    ASSERT(protocol::parse_server_message(R"({"serverContent":{"interrupted":"yes"}})").is_error());

    auto unknown = protocol::parse_server_message(R"({"usageMetadata":{}})");
    ASSERT(unknown.is_ok());
    ASSERT(unknown.value().audio_chunks.empty() && unknown.value().tool_calls.empty());

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All live protocol tests passed.\n";
    return 0;
}
