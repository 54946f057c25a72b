#include "state_machine.h"

namespace helios {

const char* state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "DISCONNECTED";
        case ConnectionState::Connecting:   return "CONNECTING";
        case ConnectionState::Connected:    return "CONNECTED";
        case ConnectionState::Error:        return "ERROR";
    }
    return "UNKNOWN";
}

class StateMachine::Impl {
public:
    Impl() : state_(ConnectionState::Disconnected) {}

    ConnectionState get_state() const {
        return state_;
    }

    bool on_event(SessionEvent event) {
        ConnectionState next = state_;

        switch (state_) {
            case ConnectionState::Disconnected:
                if (event == SessionEvent::StartRequested) {
                    next = ConnectionState::Connecting;
                }
                break;

            case ConnectionState::Connecting:
                if (event == SessionEvent::ChannelOpened) {
                    next = ConnectionState::Connected;
                } else if (event == SessionEvent::ChannelFailed) {
                    next = ConnectionState::Error;
                } else if (event == SessionEvent::ChannelClosed || event == SessionEvent::StopRequested) {
                    next = ConnectionState::Disconnected;
                }
                break;

            case ConnectionState::Connected:
                if (event == SessionEvent::ChannelFailed) {
                    next = ConnectionState::Error;
                } else if (event == SessionEvent::ChannelClosed || event == SessionEvent::StopRequested) {
                    next = ConnectionState::Disconnected;
                }
                break;

            case ConnectionState::Error:
                if (event == SessionEvent::StopRequested) {
                    next = ConnectionState::Disconnected;
                }
                break;
        }

        if (next == state_) {
            return false;
        }
        state_ = next;
        return true;
    }

    void reset() {
        state_ = ConnectionState::Disconnected;
    }

private:
    ConnectionState state_;
};

StateMachine::StateMachine() : pimpl_(std::make_unique<Impl>()) {}
StateMachine::~StateMachine() = default;

ConnectionState StateMachine::get_state() const {
    return pimpl_->get_state();
}

bool StateMachine::on_event(SessionEvent event) {
    return pimpl_->on_event(event);
}

void StateMachine::reset() {
    pimpl_->reset();
}

} // namespace helios
