#pragma once

#include "common.h"
#include "errors.h"
#include <vector>

namespace helios {

/**
 * @brief 8-bit RGB raster, row-major, no padding
 */
struct RgbImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;  ///< width * height * 3 bytes

    bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
    bool valid() const {
        return !empty() && pixels.size() == static_cast<size_t>(width) * height * 3;
    }
};

namespace image {

/**
 * @brief Resample to an exact raster (stretch to fit, bilinear)
 * @return Empty image when src is invalid or the target size is not positive
 */
RgbImage downsample(const RgbImage& src, int width, int height);

/**
 * @brief Convert packed YUYV 4:2:2 (BT.601 studio range) to RGB
 * @param bytes Size of data; must hold at least width * height * 2 bytes
 * @return false for a non-positive or odd width, or a short buffer
 */
bool yuyv_to_rgb(const uint8_t* data, size_t bytes, int width, int height, RgbImage& out);

/**
 * @brief Compress to baseline JPEG with libjpeg
 * @param quality Quality factor in (0, 1], e.g. 0.6
 * @return JPEG bytes, or EncodeError for an invalid image or a libjpeg failure
 */
Result<Bytes> encode_jpeg(const RgbImage& img, float quality);

} // namespace image

} // namespace helios
