#include "media_source.h"
#include "logger.h"
#include <algorithm>

namespace helios {

namespace {

constexpr uint8_t kBars[8][3] = {
    {192, 192, 192}, {192, 192, 0}, {0, 192, 192}, {0, 192, 0},
    {192, 0, 192},   {192, 0, 0},   {0, 0, 192},   {16, 16, 16},
};

} // namespace

TestPatternSource::TestPatternSource(int width, int height)
    : width_(width), height_(height) {}

Result<void> TestPatternSource::start() {
    if (width_ <= 0 || height_ <= 0) {
        return make_connect_error("test pattern size must be positive");
    }
    running_ = true;
    frame_index_ = 0;
    LOG_CAPTURE("Test pattern source started at " + std::to_string(width_) + "x" + std::to_string(height_));
    return {};
}

void TestPatternSource::stop() {
    running_ = false;
}

bool TestPatternSource::latest_frame(RgbImage& frame) {
    if (!running_) return false;

    frame.width = width_;
    frame.height = height_;
    frame.pixels.resize(static_cast<size_t>(width_) * height_ * 3);

    const int bar_width = std::max(1, width_ / 8);
    const int marker_bar = static_cast<int>(frame_index_ % 8);
    const int marker_top = height_ * 3 / 4;

    for (int y = 0; y < height_; ++y) {
        uint8_t* row = &frame.pixels[static_cast<size_t>(y) * width_ * 3];
        for (int x = 0; x < width_; ++x) {
            int bar = std::min(7, x / bar_width);
            uint8_t* px = row + static_cast<size_t>(x) * 3;
            if (y >= marker_top && bar == marker_bar) {
                px[0] = px[1] = px[2] = 255;
            } else {
                px[0] = kBars[bar][0];
                px[1] = kBars[bar][1];
                px[2] = kBars[bar][2];
            }
        }
    }
    ++frame_index_;
    return true;
}

} // namespace helios
