#pragma once

#include "core/constants.h"
#include <cstdint>
#include <deque>
#include <string>

namespace helios {

enum class TranscriptRole {
    User,
    Agent,
    System
};

const char* role_name(TranscriptRole role);

struct TranscriptEntry {
    TranscriptRole role = TranscriptRole::System;
    std::string text;
    int64_t timestamp_ms = 0;  ///< Wall clock, ms since epoch
};

/**
 * @brief Bounded conversation history, oldest entries evicted first
 *
 * Survives session restarts; only clear() empties it.
 */
class TranscriptLog {
public:
    explicit TranscriptLog(size_t capacity = constants::session::TRANSCRIPT_CAP);

    /**
     * @brief Append an entry stamped with the current wall clock
     * @return The stored entry
     */
    const TranscriptEntry& append(TranscriptRole role, const std::string& text);

    const std::deque<TranscriptEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

private:
    size_t capacity_;
    std::deque<TranscriptEntry> entries_;
};

} // namespace helios
