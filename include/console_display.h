#pragma once

#include "display_sink.h"
#include "common.h"
#include <string>

namespace helios {

/**
 * @brief Renders session activity through the Logger
 *
 * Status lines are rate-limited so the 5 ms loop does not flood the log.
 */
class ConsoleDisplay : public DisplaySink {
public:
    explicit ConsoleDisplay(int status_interval_ms = 2000);

    void on_state_changed(ConnectionState state) override;
    void on_transcript(const TranscriptEntry& entry) override;
    void on_status(const SystemStatus& status) override;

    /// One "name=value" pair per gauge, in name order
    static std::string format_status(const SystemStatus& status);

    /// Speaker tag printed before a transcript line
    static const char* speaker_tag(TranscriptRole role);

private:
    int status_interval_ms_;
    TimePoint last_status_;
    bool status_logged_ = false;
};

} // namespace helios
