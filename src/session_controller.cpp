#include "session_controller.h"
#include "live_protocol.h"
#include "logger.h"
#include <cmath>

namespace helios {

namespace {

double elapsed_ms(TimePoint from, TimePoint to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace

class SessionController::Impl {
public:
    Impl(const Config& config, Channel& channel, CapturePipeline& capture,
         PlaybackScheduler& playback, const ToolDispatcher& tools, DisplaySink* display)
        : config_(config), channel_(channel), capture_(capture), playback_(playback),
          tools_(tools), display_(display), transcript_(config.session.transcript_cap) {}

    ~Impl() {
        if (state_machine_.get_state() != ConnectionState::Disconnected) {
            stop();
        }
    }

    Result<void> start() {
        if (state_machine_.get_state() != ConnectionState::Disconnected) {
            return Error(ErrorType::InvalidState,
                         std::string("cannot start while ") + state_name(state_machine_.get_state()));
        }

        transition(SessionEvent::StartRequested);
        LOG_SESSION("Connecting to model " + config_.api.model);

        auto opened = channel_.open();
        if (opened.is_error()) {
            fail(opened.error().message);
            return make_connect_error(opened.error().message);
        }
        return {};
    }

    void stop() {
        if (state_machine_.get_state() == ConnectionState::Disconnected) {
            return;
        }
        channel_.close();
        teardown();
        transition(SessionEvent::StopRequested);
        LOG_SESSION("Session stopped");
    }

    void handle_event(const ChannelEvent& event) {
        ConnectionState state = state_machine_.get_state();
        bool live = state == ConnectionState::Connecting || state == ConnectionState::Connected;

        switch (event.type) {
            case ChannelEvent::Type::Open:
                if (state == ConnectionState::Connecting) {
                    on_open();
                }
                break;

            case ChannelEvent::Type::Message:
                if (state == ConnectionState::Connected) {
                    on_message(event.payload);
                } else {
                    Logger::warn(std::string("[Session] Message ignored while ") + state_name(state));
                }
                break;

            case ChannelEvent::Type::Error:
                if (live) {
                    fail(make_transport_error(event.payload.empty() ? "channel error" : event.payload).to_string());
                }
                break;

            case ChannelEvent::Type::Close:
                if (live) {
                    LOG_SESSION("Channel closed" + (event.payload.empty() ? "" : ": " + event.payload));
                    teardown();
                    transition(SessionEvent::ChannelClosed);
                }
                break;
        }
    }

    void poll(TimePoint now) {
        TimePoint work_start = Clock::now();

        ConnectionState state = state_machine_.get_state();
        if (state == ConnectionState::Connecting || state == ConnectionState::Connected) {
            for (const auto& event : channel_.poll()) {
                handle_event(event);
            }
        }

        playback_.reap_finished();
        capture_.pump(now);

        update_gauges(work_start, Clock::now());
    }

    void set_muted(bool muted) {
        capture_.set_muted(muted);
        LOG_SESSION(muted ? "Microphone muted" : "Microphone live");
    }

    bool muted() const { return capture_.muted(); }
    ConnectionState state() const { return state_machine_.get_state(); }
    const TranscriptLog& transcript() const { return transcript_; }
    const SystemStatus& status() const { return status_; }

private:
    void on_open() {
        transition(SessionEvent::ChannelOpened);

        auto activated = capture_.activate(
            [this](const MediaChunk& chunk) {
                if (!channel_.send(protocol::build_media_message(chunk).dump())) {
                    Logger::debug("[Session] Media chunk dropped: channel not open");
                }
            },
            Clock::now());
        if (activated.is_error()) {
            fail(activated.error().message);
            return;
        }

        status_.vision_active = true;
        publish_status();
        record(TranscriptRole::System, "Link established: " + config_.api.model);
        LOG_SESSION("Connected");
    }

    void on_message(const std::string& text) {
        auto parsed = protocol::parse_server_message(text);
        if (parsed.is_error()) {
            Logger::warn("[Session] Dropped message: " + parsed.error().to_string());
            return;
        }
        const ServerMessage& msg = parsed.value();

        for (const auto& chunk : msg.audio_chunks) {
            on_audio(chunk);
        }

        if (msg.input_transcription && !msg.input_transcription->empty()) {
            record(TranscriptRole::User, *msg.input_transcription);
        }
        if (msg.output_transcription && !msg.output_transcription->empty()) {
            record(TranscriptRole::Agent, *msg.output_transcription);
        }

        for (const auto& call : msg.tool_calls) {
            FunctionResponse response = tools_.handle(call);
            LOG_TOOL(call.name + " -> " + response.result);
            if (!channel_.send(protocol::build_tool_response(response).dump())) {
                Logger::warn("[Session] Tool response for '" + call.name + "' not sent");
            }
        }

        if (msg.interrupted) {
            LOG_SESSION("Interrupted by user");
            playback_.interrupt();
            publish_status();
        }

        if (msg.turn_complete) {
            Logger::debug("[Session] Turn complete");
        }
        if (msg.go_away) {
            Logger::warn("[Session] Server announced disconnect");
        }
    }

    void on_audio(const std::string& encoded) {
        TimePoint received = Clock::now();
        auto scheduled = playback_.enqueue(encoded);
        if (scheduled.is_error()) {
            Logger::warn("[Session] Audio chunk dropped: " + scheduled.error().to_string());
            return;
        }
        status_.latency_ms = elapsed_ms(received, Clock::now());
        publish_status();
    }

    void fail(const std::string& reason) {
        Logger::error("[Session] " + reason);
        channel_.close();
        teardown();
        transition(SessionEvent::ChannelFailed);
        record(TranscriptRole::System, "Link error: " + reason);
    }

    void teardown() {
        capture_.deactivate();
        playback_.stop_all();
        status_.vision_active = false;
        status_.buffer_ms = 0.0;
        publish_status();
    }

    void transition(SessionEvent event) {
        if (state_machine_.on_event(event)) {
            ConnectionState state = state_machine_.get_state();
            Logger::debug(std::string("[Session] State -> ") + state_name(state));
            if (display_) display_->on_state_changed(state);
        }
    }

    void record(TranscriptRole role, const std::string& text) {
        const TranscriptEntry& entry = transcript_.append(role, text);
        if (display_) display_->on_transcript(entry);
    }

    void update_gauges(TimePoint work_start, TimePoint work_end) {
        if (has_last_poll_) {
            double period = elapsed_ms(last_poll_, work_start) + elapsed_ms(work_start, work_end);
            if (period > 0.0) {
                double busy = 100.0 * elapsed_ms(work_start, work_end) / period;
                status_.load_percent += constants::session::LOAD_SMOOTHING * (busy - status_.load_percent);
            }
        }
        last_poll_ = work_end;
        has_last_poll_ = true;

        double buffer_ms = playback_.buffered_seconds() * 1000.0;
        if (std::fabs(buffer_ms - status_.buffer_ms) >= 1.0 ||
            std::fabs(status_.load_percent - published_load_) >= 1.0) {
            status_.buffer_ms = buffer_ms;
            publish_status();
        }
    }

    void publish_status() {
        published_load_ = status_.load_percent;
        if (display_) display_->on_status(status_);
    }

    Config config_;
    Channel& channel_;
    CapturePipeline& capture_;
    PlaybackScheduler& playback_;
    const ToolDispatcher& tools_;
    DisplaySink* display_;

    StateMachine state_machine_;
    TranscriptLog transcript_;
    SystemStatus status_;

    TimePoint last_poll_;
    bool has_last_poll_ = false;
    double published_load_ = 0.0;
};

SessionController::SessionController(const Config& config, Channel& channel, CapturePipeline& capture,
                                     PlaybackScheduler& playback, const ToolDispatcher& tools,
                                     DisplaySink* display)
    : pimpl_(std::make_unique<Impl>(config, channel, capture, playback, tools, display)) {}

SessionController::~SessionController() = default;

Result<void> SessionController::start() {
    return pimpl_->start();
}

void SessionController::stop() {
    pimpl_->stop();
}

void SessionController::handle_event(const ChannelEvent& event) {
    pimpl_->handle_event(event);
}

void SessionController::poll(TimePoint now) {
    pimpl_->poll(now);
}

void SessionController::set_muted(bool muted) {
    pimpl_->set_muted(muted);
}

bool SessionController::muted() const {
    return pimpl_->muted();
}

ConnectionState SessionController::state() const {
    return pimpl_->state();
}

const TranscriptLog& SessionController::transcript() const {
    return pimpl_->transcript();
}

const SystemStatus& SessionController::status() const {
    return pimpl_->status();
}

} // namespace helios
