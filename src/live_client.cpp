#include "live_client.h"
#include "audio_io.h"
#include "capture_pipeline.h"
#include "console_display.h"
#include "live_channel.h"
#include "live_protocol.h"
#include "logger.h"
#include "playback_scheduler.h"
#include "session_controller.h"
#include "tool_dispatcher.h"
#include "tool_registry.h"
#include "tools/parts_inventory_tool.h"
#include "tools/repair_manual_tool.h"
#include "v4l2_camera.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace helios {

class LiveClient::Impl {
public:
    explicit Impl(const Config& config)
        : config_(config), running_(true), mute_toggles_(0), initialized_(false) {}

    ~Impl() {
        shutdown();
        if (controller_) {
            controller_->stop();
        }
        speaker_.stop();
    }

    bool initialize() {
        if (initialized_) {
            return true;
        }

        register_tools();
        dispatcher_ = std::make_unique<ToolDispatcher>(registry_);

        microphone_ = std::make_unique<PortAudioMicrophone>(
            config_.audio.input_device, config_.audio.input_sample_rate, config_.audio.capture_quantum);

        if (config_.video.source == "test_pattern") {
            video_ = std::make_unique<TestPatternSource>(config_.video.source_width, config_.video.source_height);
        } else if (config_.video.source == "v4l2") {
            video_ = std::make_unique<V4l2Camera>(config_.video.device, config_.video.source_width,
                                                  config_.video.source_height);
        } else if (config_.video.source != "none") {
            Logger::warn("Unknown video source '" + config_.video.source + "', video disabled");
        }

        Logger::info("Initializing audio output...");
        Logger::info("  Input device: " + config_.audio.input_device);
        Logger::info("  Output device: " + config_.audio.output_device);
        auto speaker = speaker_.start(config_.audio.output_device, config_.audio.output_sample_rate);
        if (speaker.is_error()) {
            Logger::error("Failed to start audio output: " + speaker.error().to_string());
            return false;
        }

        playback_ = std::make_unique<PlaybackScheduler>(speaker_, config_.audio.output_sample_rate,
                                                        constants::audio::OUTPUT_CHANNELS);
        capture_ = std::make_unique<CapturePipeline>(config_.audio, config_.video, *microphone_, video_.get());

        std::string setup = protocol::build_setup_message(config_.api, dispatcher_->function_declarations()).dump();
        channel_ = std::make_unique<LiveChannel>(config_.api, setup);

        controller_ = std::make_unique<SessionController>(config_, *channel_, *capture_, *playback_,
                                                          *dispatcher_, &display_);

        initialized_ = true;
        Logger::info("Live client initialized (" + std::to_string(registry_.size()) + " tools)");
        return true;
    }

    int run() {
        if (!initialized_ && !initialize()) {
            return 1;
        }

        auto started = controller_->start();
        if (started.is_error()) {
            Logger::error("Session failed to start: " + started.error().to_string());
            return 1;
        }

        int applied_toggles = 0;
        while (running_) {
            int toggles = mute_toggles_.load();
            if (toggles != applied_toggles) {
                if ((toggles - applied_toggles) % 2 != 0) {
                    controller_->set_muted(!controller_->muted());
                }
                applied_toggles = toggles;
            }

            controller_->poll(Clock::now());

            ConnectionState state = controller_->state();
            if (state == ConnectionState::Disconnected || state == ConnectionState::Error) {
                break;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(constants::session::IDLE_SLEEP_MS));
        }

        bool failed = controller_->state() == ConnectionState::Error;
        controller_->stop();
        Logger::info("Session ended with " + std::to_string(controller_->transcript().size()) +
                     " transcript entries");
        return failed ? 1 : 0;
    }

    void shutdown() {
        running_ = false;
    }

    void toggle_mute() {
        ++mute_toggles_;
    }

private:
    void register_tools() {
        const auto& enabled = config_.tools.enabled;
        auto wants = [&enabled](const std::string& name) {
            return std::find(enabled.begin(), enabled.end(), name) != enabled.end();
        };

        auto manual = std::make_shared<RepairManualTool>();
        auto inventory = std::make_shared<PartsInventoryTool>();
        if (wants(manual->name())) registry_.register_tool(manual);
        if (wants(inventory->name())) registry_.register_tool(inventory);

        for (const auto& name : enabled) {
            if (!registry_.has_tool(name)) {
                Logger::warn("Unknown tool in config: " + name);
            }
        }
    }

    Config config_;
    std::atomic<bool> running_;
    std::atomic<int> mute_toggles_;
    bool initialized_;

    ToolRegistry registry_;
    std::unique_ptr<ToolDispatcher> dispatcher_;
    std::unique_ptr<PortAudioMicrophone> microphone_;
    std::unique_ptr<VideoSource> video_;
    PortAudioSink speaker_;
    std::unique_ptr<PlaybackScheduler> playback_;
    std::unique_ptr<CapturePipeline> capture_;
    std::unique_ptr<LiveChannel> channel_;
    ConsoleDisplay display_;
    std::unique_ptr<SessionController> controller_;
};

LiveClient::LiveClient(const Config& config) : pimpl_(std::make_unique<Impl>(config)) {}
LiveClient::~LiveClient() = default;

bool LiveClient::initialize() {
    return pimpl_->initialize();
}

int LiveClient::run() {
    return pimpl_->run();
}

void LiveClient::shutdown() {
    pimpl_->shutdown();
}

void LiveClient::toggle_mute() {
    pimpl_->toggle_mute();
}

} // namespace helios
