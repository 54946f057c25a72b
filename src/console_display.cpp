#include "console_display.h"
#include "logger.h"
#include <iomanip>
#include <sstream>

namespace helios {

ConsoleDisplay::ConsoleDisplay(int status_interval_ms)
    : status_interval_ms_(status_interval_ms) {}

void ConsoleDisplay::on_state_changed(ConnectionState state) {
    Logger::info(std::string("== ") + state_name(state) + " ==");
}

const char* ConsoleDisplay::speaker_tag(TranscriptRole role) {
    switch (role) {
        case TranscriptRole::User:   return "YOU";
        case TranscriptRole::Agent:  return "HELIOS";
        case TranscriptRole::System: return "SYSTEM";
    }
    return "?";
}

void ConsoleDisplay::on_transcript(const TranscriptEntry& entry) {
    Logger::info(std::string(speaker_tag(entry.role)) + ": " + entry.text);
}

void ConsoleDisplay::on_status(const SystemStatus& status) {
    if (status_logged_ && ms_since(last_status_) < status_interval_ms_) {
        return;
    }
    last_status_ = Clock::now();
    status_logged_ = true;

    Logger::debug(format_status(status));
}

std::string ConsoleDisplay::format_status(const SystemStatus& status) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    bool first = true;
    for (const auto& [name, value] : status.gauges()) {
        if (!first) oss << ' ';
        oss << name << '=' << value;
        first = false;
    }
    return oss.str();
}

} // namespace helios
