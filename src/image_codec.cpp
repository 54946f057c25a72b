#include "image_codec.h"
#include <algorithm>
#include <cmath>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>
#include <memory>

namespace helios {
namespace image {

namespace {

/// libjpeg reports fatal errors through error_exit; jump back instead of exiting.
struct JpegErrorManager {
    jpeg_error_mgr pub;
    jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

/// Compressor state plus the memory destination filled by jpeg_mem_dest
struct JpegJob {
    jpeg_compress_struct cinfo;
    JpegErrorManager jerr;
    unsigned char* buffer = nullptr;
    unsigned long size = 0;
};

void jpeg_error_exit(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    longjmp(err->jump, 1);
}

} // namespace

RgbImage downsample(const RgbImage& src, int width, int height) {
    RgbImage out;
    if (!src.valid() || width <= 0 || height <= 0) {
        return out;
    }
    out.width = width;
    out.height = height;
    out.pixels.resize(static_cast<size_t>(width) * height * 3);

    const double sx = static_cast<double>(src.width) / width;
    const double sy = static_cast<double>(src.height) / height;

    for (int y = 0; y < height; ++y) {
        double fy = std::max(0.0, (y + 0.5) * sy - 0.5);
        int y0 = std::min(static_cast<int>(fy), src.height - 1);
        int y1 = std::min(y0 + 1, src.height - 1);
        double wy = fy - y0;

        for (int x = 0; x < width; ++x) {
            double fx = std::max(0.0, (x + 0.5) * sx - 0.5);
            int x0 = std::min(static_cast<int>(fx), src.width - 1);
            int x1 = std::min(x0 + 1, src.width - 1);
            double wx = fx - x0;

            const uint8_t* p00 = &src.pixels[(static_cast<size_t>(y0) * src.width + x0) * 3];
            const uint8_t* p01 = &src.pixels[(static_cast<size_t>(y0) * src.width + x1) * 3];
            const uint8_t* p10 = &src.pixels[(static_cast<size_t>(y1) * src.width + x0) * 3];
            const uint8_t* p11 = &src.pixels[(static_cast<size_t>(y1) * src.width + x1) * 3];
            uint8_t* dst = &out.pixels[(static_cast<size_t>(y) * width + x) * 3];

            for (int c = 0; c < 3; ++c) {
                double top = p00[c] + (p01[c] - p00[c]) * wx;
                double bottom = p10[c] + (p11[c] - p10[c]) * wx;
                double v = top + (bottom - top) * wy;
                dst[c] = static_cast<uint8_t>(std::lround(std::min(255.0, std::max(0.0, v))));
            }
        }
    }
    return out;
}

bool yuyv_to_rgb(const uint8_t* data, size_t bytes, int width, int height, RgbImage& out) {
    if (!data || width <= 0 || height <= 0 || width % 2 != 0) return false;
    const size_t pixels = static_cast<size_t>(width) * height;
    if (bytes < pixels * 2) return false;

    out.width = width;
    out.height = height;
    out.pixels.resize(pixels * 3);

    auto clamp8 = [](int v) { return static_cast<uint8_t>(std::min(255, std::max(0, v))); };
    uint8_t* dst = out.pixels.data();
    for (size_t i = 0; i < pixels; i += 2) {
        const uint8_t* px = data + i * 2;  // Y0 U Y1 V
        const int d = px[1] - 128;
        const int e = px[3] - 128;
        for (int k = 0; k < 2; ++k) {
            const int c = 298 * (px[k * 2] - 16);
            *dst++ = clamp8((c + 409 * e + 128) >> 8);
            *dst++ = clamp8((c - 100 * d - 208 * e + 128) >> 8);
            *dst++ = clamp8((c + 516 * d + 128) >> 8);
        }
    }
    return true;
}

Result<Bytes> encode_jpeg(const RgbImage& img, float quality) {
    if (!img.valid()) {
        return make_encode_error("cannot encode invalid image " + std::to_string(img.width) +
                                 "x" + std::to_string(img.height));
    }

    // Everything libjpeg writes lives on the heap so it stays valid across longjmp
    auto job = std::make_unique<JpegJob>();
    jpeg_compress_struct& cinfo = job->cinfo;

    cinfo.err = jpeg_std_error(&job->jerr.pub);
    job->jerr.pub.error_exit = jpeg_error_exit;
    if (setjmp(job->jerr.jump)) {
        jpeg_destroy_compress(&cinfo);
        std::free(job->buffer);
        return make_encode_error(std::string("libjpeg: ") + job->jerr.message);
    }

    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, &job->buffer, &job->size);

    cinfo.image_width = static_cast<JDIMENSION>(img.width);
    cinfo.image_height = static_cast<JDIMENSION>(img.height);
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);

    int q = static_cast<int>(std::lround(std::min(1.0f, std::max(0.01f, quality)) * 100.0f));
    jpeg_set_quality(&cinfo, q, TRUE);

    jpeg_start_compress(&cinfo, TRUE);
    const size_t stride = static_cast<size_t>(img.width) * 3;
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = const_cast<JSAMPLE*>(&img.pixels[cinfo.next_scanline * stride]);
        jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);

    Bytes result(job->buffer, job->buffer + job->size);
    jpeg_destroy_compress(&cinfo);
    std::free(job->buffer);
    return result;
}

} // namespace image
} // namespace helios
