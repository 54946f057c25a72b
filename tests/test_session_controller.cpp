/**
 * Session lifecycle and message routing.
 * Asserts:
 * - Disconnected -> Connecting -> Connected on start() and the Open event; capture runs only while Connected.
 * - inbound audio is scheduled, transcriptions recorded, tool calls answered, interruptions flush playback.
 * - Error and Close tear everything down; start() is rejected unless Disconnected.
 *
 * Run from build dir: ./test_session_controller
 * No audio hardware or network required.
 */

#include "session_controller.h"
#include "codec.h"
#include "fakes.h"
#include "tools/parts_inventory_tool.h"
#include "tools/repair_manual_tool.h"
#include <iostream>
#include <memory>

using namespace helios;
using namespace helios::testing;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

/// Everything a controller borrows, wired together
struct Rig {
    Config config;
    FakeChannel channel;
    FakeAudioSink sink;
    FakeMicrophone mic;
    FakeVideoSource cam;
    ToolRegistry registry;
    RecordingDisplay display;
    std::unique_ptr<PlaybackScheduler> playback;
    std::unique_ptr<CapturePipeline> capture;
    std::unique_ptr<ToolDispatcher> dispatcher;
    std::unique_ptr<SessionController> controller;

    Rig() {
        config.video.width = 64;
        config.video.height = 36;
        registry.register_tool(std::make_shared<RepairManualTool>());
        registry.register_tool(std::make_shared<PartsInventoryTool>());
        playback = std::make_unique<PlaybackScheduler>(sink);
        capture = std::make_unique<CapturePipeline>(config.audio, config.video, mic, &cam);
        dispatcher = std::make_unique<ToolDispatcher>(registry);
        controller = std::make_unique<SessionController>(config, channel, *capture, *playback,
                                                         *dispatcher, &display);
    }

    void connect() {
        controller->start();
        channel.push(ChannelEvent::open());
        controller->poll(Clock::now());
    }

    void receive(const json& msg) {
        channel.push(ChannelEvent::message(msg.dump()));
        controller->poll(Clock::now());
    }

    size_t sent_with(const std::string& key) const {
        size_t n = 0;
        for (const auto& s : channel.sent) {
            if (json::parse(s).contains(key)) ++n;
        }
        return n;
    }
};

json audio_message(size_t frames) {
    json part = {{"inlineData", {{"mimeType", "audio/pcm;rate=24000"},
                                 {"data", codec::encode_bytes(Bytes(frames * 2, 0))}}}};
    return json{{"serverContent", {{"modelTurn", {{"parts", json::array({part})}}}}}};
}

} // namespace

int main() {
    // --- start -> open ---
    {
        Rig rig;
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);

        auto started = rig.controller->start();
        ASSERT(started.is_ok());
        ASSERT(rig.controller->state() == ConnectionState::Connecting);
        ASSERT(rig.channel.open_calls == 1);
        ASSERT(!rig.capture->active());

        // Messages before setup completes are ignored
        rig.receive(audio_message(240));
        ASSERT(rig.sink.started.empty());

        rig.channel.push(ChannelEvent::open());
        rig.controller->poll(Clock::now());
        ASSERT(rig.controller->state() == ConnectionState::Connected);
        ASSERT(rig.capture->active());
        ASSERT(rig.capture->timer_active());
        ASSERT(rig.mic.running);
        ASSERT(rig.controller->status().vision_active);
        ASSERT(rig.controller->transcript().size() == 1);
        ASSERT(rig.controller->transcript().entries().back().role == TranscriptRole::System);

        ASSERT(rig.display.states.size() == 2);
        ASSERT(rig.display.states[0] == ConnectionState::Connecting);
        ASSERT(rig.display.states[1] == ConnectionState::Connected);

        // start() outside Disconnected is rejected without side effects
        auto again = rig.controller->start();
        ASSERT(again.is_error());
        ASSERT(again.error().type == ErrorType::InvalidState);
        ASSERT(rig.channel.open_calls == 1);
        ASSERT(rig.controller->state() == ConnectionState::Connected);
    }

    // --- outbound media flows through the channel ---
    {
        Rig rig;
        rig.connect();
        rig.mic.push(std::vector<float>(4096, 0.1f));
        rig.controller->poll(Clock::now());
        ASSERT(rig.sent_with("realtimeInput") == 1);
        json sent = json::parse(rig.channel.sent.back());
        ASSERT(sent["realtimeInput"]["mediaChunks"][0]["mimeType"] == "audio/pcm;rate=16000");

        rig.controller->set_muted(true);
        ASSERT(rig.controller->muted());
        rig.mic.push(std::vector<float>(4096, 0.1f));
        rig.controller->poll(Clock::now());
        ASSERT(rig.sent_with("realtimeInput") == 1);

        // Video frames still go out while muted
        rig.controller->poll(Clock::now() + std::chrono::milliseconds(600));
        ASSERT(rig.sent_with("realtimeInput") == 2);
        json frame = json::parse(rig.channel.sent.back());
        ASSERT(frame["realtimeInput"]["mediaChunks"][0]["mimeType"] == "image/jpeg");
    }

    // --- inbound audio ---
    {
        Rig rig;
        rig.connect();
        rig.receive(audio_message(12000));
        rig.receive(audio_message(12000));
        ASSERT(rig.sink.started.size() == 2);
        ASSERT(rig.sink.started[1].when == 0.5);
        ASSERT(rig.playback->active_count() == 2);
        ASSERT(rig.controller->status().latency_ms >= 0.0);

        // Malformed chunk is dropped; the session continues
        json bad = {{"serverContent", {{"modelTurn", {{"parts", json::array({
            json{{"inlineData", {{"data", "@@@"}}}}})}}}}}};
        rig.receive(bad);
        ASSERT(rig.sink.started.size() == 2);
        ASSERT(rig.controller->state() == ConnectionState::Connected);

        // Unparsable frames are dropped too
        rig.channel.push(ChannelEvent::message("{oops"));
        rig.controller->poll(Clock::now());
        ASSERT(rig.controller->state() == ConnectionState::Connected);

        // Completed sources are reaped on poll
        rig.sink.finish(rig.sink.started[0].id);
        rig.controller->poll(Clock::now());
        ASSERT(rig.playback->active_count() == 1);
    }

    // --- transcriptions ---
    {
        Rig rig;
        rig.connect();
        rig.receive(json{{"serverContent", {{"inputTranscription", {{"text", "Is this safe?"}}}}}});
        rig.receive(json{{"serverContent", {{"outputTranscription", {{"text", "Discharge first."}}}}}});
        rig.receive(json{{"serverContent", {{"outputTranscription", {{"text", ""}}}}}});

        const auto& entries = rig.controller->transcript().entries();
        ASSERT(entries.size() == 3);  // link entry + two lines
        ASSERT(entries[1].role == TranscriptRole::User);
        ASSERT(entries[1].text == "Is this safe?");
        ASSERT(entries[2].role == TranscriptRole::Agent);
        ASSERT(entries[2].text == "Discharge first.");
        ASSERT(rig.display.entries.size() == 3);

        for (int i = 0; i < 60; ++i) {
            rig.receive(json{{"serverContent", {{"outputTranscription", {{"text", "w" + std::to_string(i)}}}}}});
        }
        ASSERT(rig.controller->transcript().size() == 50);
        ASSERT(rig.controller->transcript().entries().back().text == "w59");
    }

    // --- tool calls ---
    {
        Rig rig;
        rig.connect();
        size_t before = rig.channel.sent.size();
        rig.receive(json{{"toolCall", {{"functionCalls", json::array({
            json{{"id", "c1"}, {"name", "check_parts_inventory"}, {"args", {{"part_id", "FAN-9"}}}},
            json{{"id", "c2"}, {"name", "launch_rocket"}, {"args", json::object()}}
        })}}}});
        ASSERT(rig.channel.sent.size() == before + 2);

        json first = json::parse(rig.channel.sent[before]);
        const json& r1 = first["toolResponse"]["functionResponses"][0];
        ASSERT(r1["id"] == "c1");
        ASSERT(r1["name"] == "check_parts_inventory");
        ASSERT(r1["response"]["result"] == "INVENTORY_MGMT: SKU FAN-9 located in Bay 4. Stock: 14 units. "
                                           "Replacement estimated at 45 minutes labor.");

        json second = json::parse(rig.channel.sent[before + 1]);
        const json& r2 = second["toolResponse"]["functionResponses"][0];
        ASSERT(r2["id"] == "c2");
        ASSERT(r2["response"]["result"] == "Error: Invalid Call");
        ASSERT(rig.controller->state() == ConnectionState::Connected);
    }

    // --- interruption ---
    {
        Rig rig;
        rig.connect();
        rig.sink.now = 2.0;
        rig.receive(audio_message(24000));
        rig.receive(audio_message(24000));
        ASSERT(rig.playback->next_start_time() == 4.0);

        rig.receive(json{{"serverContent", {{"interrupted", true}}}});
        ASSERT(rig.playback->active_count() == 0);
        ASSERT(rig.playback->next_start_time() == 0.0);
        ASSERT(rig.sink.stopped.size() == 2);

        // Audio and interruption in one message: audio is scheduled, then flushed
        json both = audio_message(240);
        both["serverContent"]["interrupted"] = true;
        rig.receive(both);
        ASSERT(rig.sink.started.size() == 3);
        ASSERT(rig.playback->active_count() == 0);
    }

    // --- channel error ---
    {
        Rig rig;
        rig.connect();
        rig.receive(audio_message(2400));
        rig.channel.push(ChannelEvent::error("socket reset"));
        rig.controller->poll(Clock::now());
        ASSERT(rig.controller->state() == ConnectionState::Error);
        ASSERT(!rig.capture->active());
        ASSERT(!rig.capture->timer_active());
        ASSERT(!rig.mic.running);
        ASSERT(!rig.cam.running);
        ASSERT(rig.playback->active_count() == 0);
        ASSERT(!rig.controller->status().vision_active);
        ASSERT(rig.controller->transcript().entries().back().role == TranscriptRole::System);
        ASSERT(rig.controller->transcript().entries().back().text ==
               "Link error: TransportError: socket reset");

        // Error is sticky until stop()
        rig.channel.push(ChannelEvent::open());
        rig.controller->poll(Clock::now());
        ASSERT(rig.controller->state() == ConnectionState::Error);
        ASSERT(rig.controller->start().is_error());

        rig.controller->stop();
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);
        size_t kept = rig.controller->transcript().size();

        // A new session may start; the transcript carries over
        rig.connect();
        ASSERT(rig.controller->state() == ConnectionState::Connected);
        ASSERT(rig.controller->transcript().size() == kept + 1);
    }

    // --- remote close ---
    {
        Rig rig;
        rig.connect();
        rig.receive(audio_message(4800));
        ASSERT(rig.playback->active_count() == 1);
        ASSERT(rig.capture->timer_active());

        rig.channel.push(ChannelEvent::close());
        rig.controller->poll(Clock::now());
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);
        ASSERT(!rig.capture->active());
        ASSERT(!rig.capture->timer_active());
        ASSERT(rig.playback->active_count() == 0);
        ASSERT(rig.sink.playing.empty());
        ASSERT(!rig.controller->status().vision_active);

        // Events after close are ignored
        rig.receive(audio_message(240));
        ASSERT(rig.sink.started.empty());
    }

    // --- open failure ---
    {
        Rig rig;
        rig.channel.fail_open = true;
        auto r = rig.controller->start();
        ASSERT(r.is_error());
        ASSERT(r.error().type == ErrorType::ConnectError);
        ASSERT(rig.controller->state() == ConnectionState::Error);
        ASSERT(!rig.capture->active());
    }

    // --- capture failure after open ---
    {
        Rig rig;
        rig.mic.fail_start = true;
        rig.connect();
        ASSERT(rig.controller->state() == ConnectionState::Error);
        ASSERT(rig.channel.close_calls >= 1);
        ASSERT(!rig.controller->status().vision_active);
    }

    // --- user stop ---
    {
        Rig rig;
        rig.connect();
        rig.receive(audio_message(24000));
        rig.controller->stop();
        ASSERT(rig.controller->state() == ConnectionState::Disconnected);
        ASSERT(rig.channel.close_calls == 1);
        ASSERT(!rig.capture->active());
        ASSERT(rig.playback->active_count() == 0);
        ASSERT(rig.playback->next_start_time() == 0.0);

        rig.controller->stop();  // no-op when already Disconnected
        ASSERT(rig.channel.close_calls == 1);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All session controller tests passed.\n";
    return 0;
}
