#pragma once

#include "state_machine.h"
#include "transcript_log.h"
#include <map>
#include <string>

namespace helios {

/**
 * @brief Gauges shown alongside the conversation
 */
struct SystemStatus {
    double load_percent = 0.0;  ///< Share of loop time spent working (smoothed)
    double buffer_ms = 0.0;     ///< Scheduled audio not yet played
    double latency_ms = 0.0;    ///< Receive-to-scheduled time of the last audio chunk
    bool vision_active = false;

    /// Named numeric view for status lines
    std::map<std::string, double> gauges() const {
        return {
            {"load", load_percent},
            {"buffer_ms", buffer_ms},
            {"latency_ms", latency_ms},
            {"vision", vision_active ? 1.0 : 0.0},
        };
    }
};

/**
 * @brief Receiver of everything a user interface would render
 */
class DisplaySink {
public:
    virtual ~DisplaySink() = default;

    virtual void on_state_changed(ConnectionState state) = 0;
    virtual void on_transcript(const TranscriptEntry& entry) = 0;
    virtual void on_status(const SystemStatus& status) = 0;
};

} // namespace helios
