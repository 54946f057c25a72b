#pragma once

#include <memory>

namespace helios {

/**
 * @brief Session connection state
 */
enum class ConnectionState {
    Disconnected,  ///< Idle; start() allowed
    Connecting,    ///< Channel opening, waiting for setup to complete
    Connected,     ///< Media flowing both ways
    Error          ///< Failed; stop() returns to Disconnected
};

/**
 * @brief Inputs that drive the session lifecycle
 */
enum class SessionEvent {
    StartRequested,
    ChannelOpened,
    ChannelClosed,
    ChannelFailed,
    StopRequested
};

const char* state_name(ConnectionState state);

/**
 * @brief State machine for the session lifecycle
 *
 * - Disconnected -> Connecting (on StartRequested)
 * - Connecting -> Connected (on ChannelOpened)
 * - Connecting/Connected -> Error (on ChannelFailed)
 * - Connecting/Connected -> Disconnected (on ChannelClosed)
 * - Connecting/Connected/Error -> Disconnected (on StopRequested)
 *
 * Any other event leaves the state unchanged.
 */
class StateMachine {
public:
    StateMachine();
    ~StateMachine();

    ConnectionState get_state() const;

    /**
     * @brief Apply an event
     * @return true if the state changed
     */
    bool on_event(SessionEvent event);

    /**
     * @brief Reset state machine to Disconnected
     */
    void reset();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace helios
