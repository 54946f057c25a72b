#pragma once

#include "channel.h"
#include "config.h"
#include <memory>

namespace helios {

/**
 * @brief Channel over a libcurl WebSocket to the Live endpoint
 *
 * Uses connect-only mode: curl performs the HTTP upgrade, after which
 * frames are exchanged with non-blocking curl_ws_send / curl_ws_recv.
 * The setup message is sent right after the handshake; the Open event is
 * reported when the server answers with setupComplete.
 */
class LiveChannel : public Channel {
public:
    /**
     * @param api Endpoint, key and connect timeout
     * @param setup_message Serialized setup message sent after the handshake
     */
    LiveChannel(const ApiConfig& api, const std::string& setup_message);
    ~LiveChannel() override;

    LiveChannel(const LiveChannel&) = delete;
    LiveChannel& operator=(const LiveChannel&) = delete;

    Result<void> open() override;
    bool send(const std::string& text) override;
    std::vector<ChannelEvent> poll() override;
    void close() override;
    bool is_open() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace helios
