#pragma once

#include "media_source.h"
#include <memory>
#include <string>

namespace helios {

/**
 * @brief Camera capture through Video4Linux2
 *
 * Requests YUYV frames at the configured size (the driver may pick the
 * closest size it supports) and streams them through memory-mapped buffers.
 * latest_frame() never blocks: it drains every frame the driver has ready
 * and converts only the newest, falling back to the previous frame when
 * nothing new has arrived.
 */
class V4l2Camera : public VideoSource {
public:
    /**
     * @param device Device node, e.g. "/dev/video0"
     */
    V4l2Camera(const std::string& device, int width, int height);
    ~V4l2Camera() override;

    V4l2Camera(const V4l2Camera&) = delete;
    V4l2Camera& operator=(const V4l2Camera&) = delete;

    /**
     * @return ConnectError if the device is missing, cannot stream, or
     *         does not offer YUYV
     */
    Result<void> start() override;
    void stop() override;
    bool is_running() const override;
    bool latest_frame(RgbImage& frame) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace helios
