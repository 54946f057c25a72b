#include "v4l2_camera.h"
#include "logger.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/videodev2.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <unistd.h>
#include <vector>

namespace helios {

namespace {

constexpr unsigned int kBufferCount = 4;

int xioctl(int fd, unsigned long request, void* arg) {
    int r;
    do {
        r = ioctl(fd, request, arg);
    } while (r == -1 && errno == EINTR);
    return r;
}

std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

class V4l2Camera::Impl {
public:
    Impl(const std::string& device, int width, int height)
        : device_(device), width_(width), height_(height) {}

    ~Impl() {
        stop();
    }

    Result<void> start() {
        if (running_) return {};

        fd_ = open(device_.c_str(), O_RDWR | O_NONBLOCK);
        if (fd_ < 0) {
            return make_connect_error(errno_text("Cannot open " + device_));
        }

        v4l2_capability cap;
        std::memset(&cap, 0, sizeof(cap));
        if (xioctl(fd_, VIDIOC_QUERYCAP, &cap) == -1) {
            return fail(errno_text(device_ + " is not a V4L2 device"));
        }
        if (!(cap.capabilities & V4L2_CAP_VIDEO_CAPTURE) || !(cap.capabilities & V4L2_CAP_STREAMING)) {
            return fail(device_ + " cannot stream video capture");
        }

        v4l2_format fmt;
        std::memset(&fmt, 0, sizeof(fmt));
        fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        fmt.fmt.pix.width = static_cast<__u32>(width_);
        fmt.fmt.pix.height = static_cast<__u32>(height_);
        fmt.fmt.pix.pixelformat = V4L2_PIX_FMT_YUYV;
        fmt.fmt.pix.field = V4L2_FIELD_NONE;
        if (xioctl(fd_, VIDIOC_S_FMT, &fmt) == -1) {
            return fail(errno_text("VIDIOC_S_FMT"));
        }
        if (fmt.fmt.pix.pixelformat != V4L2_PIX_FMT_YUYV) {
            return fail(device_ + " does not offer YUYV");
        }
        frame_width_ = static_cast<int>(fmt.fmt.pix.width);
        frame_height_ = static_cast<int>(fmt.fmt.pix.height);

        v4l2_requestbuffers req;
        std::memset(&req, 0, sizeof(req));
        req.count = kBufferCount;
        req.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        req.memory = V4L2_MEMORY_MMAP;
        if (xioctl(fd_, VIDIOC_REQBUFS, &req) == -1 || req.count == 0) {
            return fail(errno_text("VIDIOC_REQBUFS"));
        }

        for (unsigned int i = 0; i < req.count; ++i) {
            v4l2_buffer buf;
            std::memset(&buf, 0, sizeof(buf));
            buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
            buf.memory = V4L2_MEMORY_MMAP;
            buf.index = i;
            if (xioctl(fd_, VIDIOC_QUERYBUF, &buf) == -1) {
                return fail(errno_text("VIDIOC_QUERYBUF"));
            }
            void* addr = mmap(nullptr, buf.length, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, buf.m.offset);
            if (addr == MAP_FAILED) {
                return fail(errno_text("mmap"));
            }
            buffers_.push_back({addr, buf.length});

            if (xioctl(fd_, VIDIOC_QBUF, &buf) == -1) {
                return fail(errno_text("VIDIOC_QBUF"));
            }
        }

        v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        if (xioctl(fd_, VIDIOC_STREAMON, &type) == -1) {
            return fail(errno_text("VIDIOC_STREAMON"));
        }

        running_ = true;
        has_frame_ = false;
        LOG_CAPTURE("Camera " + device_ + " streaming " + std::to_string(frame_width_) + "x" +
                    std::to_string(frame_height_) + " YUYV");
        return {};
    }

    void stop() {
        if (running_) {
            v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
            if (xioctl(fd_, VIDIOC_STREAMOFF, &type) == -1) {
                Logger::warn("[Capture] " + errno_text("VIDIOC_STREAMOFF"));
            }
            running_ = false;
        }
        release();
    }

    bool is_running() const { return running_; }

    bool latest_frame(RgbImage& frame) {
        if (!running_) return false;

        bool fresh = false;
        for (;;) {
            v4l2_buffer buf;
            std::memset(&buf, 0, sizeof(buf));
            buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
            buf.memory = V4L2_MEMORY_MMAP;
            if (xioctl(fd_, VIDIOC_DQBUF, &buf) == -1) {
                if (errno != EAGAIN) {
                    Logger::warn("[Capture] " + errno_text("VIDIOC_DQBUF"));
                }
                break;
            }

            if (buf.index < buffers_.size()) {
                const auto& mapped = buffers_[buf.index];
                size_t used = buf.bytesused > 0 ? buf.bytesused : mapped.length;
                if (image::yuyv_to_rgb(static_cast<const uint8_t*>(mapped.start), used,
                                       frame_width_, frame_height_, last_)) {
                    fresh = true;
                }
            }

            if (xioctl(fd_, VIDIOC_QBUF, &buf) == -1) {
                Logger::warn("[Capture] " + errno_text("VIDIOC_QBUF"));
                break;
            }
        }

        if (fresh) has_frame_ = true;
        if (!has_frame_) return false;
        frame = last_;
        return true;
    }

private:
    struct Mapped {
        void* start;
        size_t length;
    };

    Error fail(const std::string& reason) {
        release();
        return make_connect_error(reason);
    }

    void release() {
        for (const auto& b : buffers_) {
            munmap(b.start, b.length);
        }
        buffers_.clear();
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
    }

    std::string device_;
    int width_;
    int height_;
    int frame_width_ = 0;
    int frame_height_ = 0;

    int fd_ = -1;
    bool running_ = false;
    std::vector<Mapped> buffers_;

    RgbImage last_;
    bool has_frame_ = false;
};

V4l2Camera::V4l2Camera(const std::string& device, int width, int height)
    : pimpl_(std::make_unique<Impl>(device, width, height)) {}

V4l2Camera::~V4l2Camera() = default;

Result<void> V4l2Camera::start() {
    return pimpl_->start();
}

void V4l2Camera::stop() {
    pimpl_->stop();
}

bool V4l2Camera::is_running() const {
    return pimpl_->is_running();
}

bool V4l2Camera::latest_frame(RgbImage& frame) {
    return pimpl_->latest_frame(frame);
}

} // namespace helios
