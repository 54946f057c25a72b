#pragma once

#include "codec.h"
#include <cstdint>
#include <vector>

namespace helios {

/// Handle of one scheduled playback source
using SourceId = uint64_t;

/**
 * @brief Output device with a monotonic playback clock
 *
 * Sources are scheduled at absolute clock times (seconds since the device
 * started). A source that plays to its end is reported once through
 * take_finished(); a source removed with stop_source() is not.
 */
class AudioSink {
public:
    virtual ~AudioSink() = default;

    /// Current output clock in seconds; never decreases
    virtual double current_time() const = 0;

    /// Schedule buffer to start exactly at `when` seconds
    virtual SourceId start_source(const PlayableBuffer& buffer, double when) = 0;

    /// Force-stop a source immediately
    virtual void stop_source(SourceId id) = 0;

    /// Sources that completed naturally since the last call
    virtual std::vector<SourceId> take_finished() = 0;
};

} // namespace helios
