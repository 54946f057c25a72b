#include "transcript_log.h"
#include "common.h"

namespace helios {

const char* role_name(TranscriptRole role) {
    switch (role) {
        case TranscriptRole::User:   return "user";
        case TranscriptRole::Agent:  return "agent";
        case TranscriptRole::System: return "system";
    }
    return "unknown";
}

TranscriptLog::TranscriptLog(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

const TranscriptEntry& TranscriptLog::append(TranscriptRole role, const std::string& text) {
    TranscriptEntry entry;
    entry.role = role;
    entry.text = text;
    entry.timestamp_ms = wall_clock_ms();

    entries_.push_back(std::move(entry));
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
    return entries_.back();
}

} // namespace helios
