#pragma once

#include "capture_pipeline.h"
#include "channel.h"
#include "config.h"
#include "display_sink.h"
#include "playback_scheduler.h"
#include "state_machine.h"
#include "tool_dispatcher.h"
#include "transcript_log.h"
#include <memory>

namespace helios {

/**
 * @brief Owns the lifecycle of one live session and routes its traffic
 *
 * Drives the connection state machine from channel events, starts and stops
 * capture, feeds received audio to the playback scheduler, records
 * transcriptions, and answers tool calls. Everything runs on the thread
 * that calls poll().
 *
 * Collaborators are borrowed and must outlive the controller.
 */
class SessionController {
public:
    /**
     * @param display Optional; notified of state, transcript and status changes
     */
    SessionController(const Config& config,
                      Channel& channel,
                      CapturePipeline& capture,
                      PlaybackScheduler& playback,
                      const ToolDispatcher& tools,
                      DisplaySink* display = nullptr);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /**
     * @brief Open the channel
     * @return InvalidState unless Disconnected; ConnectError if the channel
     *         cannot be opened (state becomes Error)
     */
    Result<void> start();

    /**
     * @brief Close the channel and tear down; no-op when Disconnected
     */
    void stop();

    /**
     * @brief Apply one channel event in the current state
     */
    void handle_event(const ChannelEvent& event);

    /**
     * @brief One event-loop iteration
     *
     * Drains channel events, reaps finished playback, pumps capture and
     * refreshes the gauges.
     */
    void poll(TimePoint now);

    void set_muted(bool muted);
    bool muted() const;

    ConnectionState state() const;
    const TranscriptLog& transcript() const;
    const SystemStatus& status() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace helios
