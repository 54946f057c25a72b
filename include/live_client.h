#pragma once

#include "config.h"
#include <memory>

namespace helios {

/**
 * @brief Live session runner
 *
 * Builds the devices, tools and channel from configuration, then drives a
 * SessionController until the session ends or shutdown() is requested.
 */
class LiveClient {
public:
    explicit LiveClient(const Config& config);
    ~LiveClient();

    LiveClient(const LiveClient&) = delete;
    LiveClient& operator=(const LiveClient&) = delete;

    /**
     * @brief Create all components and open the output device
     * @return True if initialization successful, false otherwise
     */
    bool initialize();

    /**
     * @brief Run the session loop
     * @return Exit code (0 when the session ended normally, 1 on error)
     */
    int run();

    /**
     * @brief Request shutdown (async-signal safe)
     */
    void shutdown();

    /**
     * @brief Flip the microphone mute state on the next loop iteration (async-signal safe)
     */
    void toggle_mute();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace helios
