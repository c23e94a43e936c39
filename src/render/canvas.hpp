#pragma once

#include "core/types.hpp"
#include <opencv2/core.hpp>
#include <cstddef>

namespace codevis {

// RGB8 image backed by an anonymous private mapping, so pages are only
// committed once they are written. The cv::Mat header borrows the mapping.
class Canvas {
public:
    static constexpr int kChannels = 3;

    Canvas() = default;
    ~Canvas();

    Canvas(const Canvas&) = delete;
    Canvas& operator=(const Canvas&) = delete;
    Canvas(Canvas&& other) noexcept;
    Canvas& operator=(Canvas&& other) noexcept;

    Result allocate(int width, int height);
    void release();

    int width() const { return width_; }
    int height() const { return height_; }
    bool empty() const { return data_ == nullptr; }
    std::size_t byte_size() const { return bytes_; }

    cv::Mat& mat() { return mat_; }
    const cv::Mat& mat() const { return mat_; }

    Color get_pixel(int x, int y) const;

private:
    void* data_ = nullptr;
    std::size_t bytes_ = 0;
    int width_ = 0;
    int height_ = 0;
    cv::Mat mat_;
};

}
