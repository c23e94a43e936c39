#include "render/canvas.hpp"
#include <cerrno>
#include <cstring>
#include <sys/mman.h>

namespace codevis {

Canvas::~Canvas() {
    release();
}

Canvas::Canvas(Canvas&& other) noexcept
    : data_(other.data_), bytes_(other.bytes_), width_(other.width_),
      height_(other.height_), mat_(other.mat_) {
    other.data_ = nullptr;
    other.bytes_ = 0;
    other.width_ = 0;
    other.height_ = 0;
    other.mat_ = cv::Mat();
}

Canvas& Canvas::operator=(Canvas&& other) noexcept {
    if (this != &other) {
        release();
        data_ = other.data_;
        bytes_ = other.bytes_;
        width_ = other.width_;
        height_ = other.height_;
        mat_ = other.mat_;
        other.data_ = nullptr;
        other.bytes_ = 0;
        other.width_ = 0;
        other.height_ = 0;
        other.mat_ = cv::Mat();
    }
    return *this;
}

Result Canvas::allocate(int width, int height) {
    release();
    if (width <= 0 || height <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "canvas dimensions must be positive");
    }

    const std::size_t bytes = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * kChannels;
    void* mem = ::mmap(nullptr, bytes, PROT_READ | PROT_WRITE,
                       MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE, -1, 0);
    if (mem == MAP_FAILED) {
        return Result::fail(ErrorCode::MEMORY_ERROR,
                            std::string("can not map canvas memory: ") + std::strerror(errno));
    }

    data_ = mem;
    bytes_ = bytes;
    width_ = width;
    height_ = height;
    mat_ = cv::Mat(height, width, CV_8UC3, data_);
    return Result::ok();
}

void Canvas::release() {
    mat_ = cv::Mat();
    if (data_) {
        ::munmap(data_, bytes_);
    }
    data_ = nullptr;
    bytes_ = 0;
    width_ = 0;
    height_ = 0;
}

Color Canvas::get_pixel(int x, int y) const {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) return Color();
    const cv::Vec3b& px = mat_.at<cv::Vec3b>(y, x);
    return Color(px[0], px[1], px[2]);
}

}
