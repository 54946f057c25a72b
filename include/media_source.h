#pragma once

#include "errors.h"
#include "image_codec.h"
#include <vector>

namespace helios {

/**
 * @brief Continuous microphone sample stream
 *
 * Implementations deliver fixed-size quanta of mono float samples in
 * [-1, 1]. read_quantum() is polled from the session loop and must not
 * block.
 */
class MicrophoneSource {
public:
    virtual ~MicrophoneSource() = default;

    virtual Result<void> start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    /**
     * @brief Pop the oldest captured quantum
     * @return false when no quantum is pending
     */
    virtual bool read_quantum(std::vector<float>& samples) = 0;
};

/**
 * @brief Continuous video feed; the capture pipeline samples its latest frame
 */
class VideoSource {
public:
    virtual ~VideoSource() = default;

    virtual Result<void> start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    /**
     * @brief Copy the most recent frame
     * @return false when no frame is available yet
     */
    virtual bool latest_frame(RgbImage& frame) = 0;
};

/**
 * @brief Colour-bar generator standing in for a camera
 *
 * Eight vertical bars with a marker that moves one bar per frame, so
 * successive frames differ.
 */
class TestPatternSource : public VideoSource {
public:
    TestPatternSource(int width, int height);

    Result<void> start() override;
    void stop() override;
    bool is_running() const override { return running_; }
    bool latest_frame(RgbImage& frame) override;

private:
    int width_;
    int height_;
    bool running_ = false;
    uint64_t frame_index_ = 0;
};

} // namespace helios
