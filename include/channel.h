#pragma once

#include "errors.h"
#include <string>
#include <vector>

namespace helios {

/**
 * @brief Something that happened on the duplex channel
 */
struct ChannelEvent {
    enum class Type {
        Open,     ///< Session negotiated; media may flow
        Message,  ///< One complete inbound text payload
        Error,    ///< Transport failure; payload holds the reason
        Close     ///< Remote end closed the session
    };

    Type type = Type::Message;
    std::string payload;

    static ChannelEvent open() { return {Type::Open, ""}; }
    static ChannelEvent message(const std::string& text) { return {Type::Message, text}; }
    static ChannelEvent error(const std::string& reason) { return {Type::Error, reason}; }
    static ChannelEvent close(const std::string& reason = "") { return {Type::Close, reason}; }
};

/**
 * @brief Bidirectional message channel to the model
 *
 * Polled rather than callback-driven: all events are handed out by poll()
 * on the caller's thread, in arrival order.
 */
class Channel {
public:
    virtual ~Channel() = default;

    /**
     * @brief Connect and negotiate the session
     *
     * Success means the transport is up; the Open event follows once the
     * remote end acknowledges the session.
     * @return ConnectError if the connection cannot be established
     */
    virtual Result<void> open() = 0;

    /**
     * @brief Queue one text message for sending
     * @return false if the channel is not open
     */
    virtual bool send(const std::string& text) = 0;

    /**
     * @brief Flush pending sends and collect inbound events without blocking
     */
    virtual std::vector<ChannelEvent> poll() = 0;

    /**
     * @brief Close immediately; pending sends are discarded
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

} // namespace helios
