#include "io/image_writer.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace codevis {

Result write_image(const Canvas& canvas, const std::string& path) {
    if (canvas.empty()) {
        return Result::fail(ErrorCode::EMPTY_INPUT, "Nothing to write");
    }
    if (path.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "No output path given");
    }

    try {
        cv::Mat bgr;
        cv::cvtColor(canvas.mat(), bgr, cv::COLOR_RGB2BGR);
        if (!cv::imwrite(path, bgr)) {
            return Result::fail(ErrorCode::PROCESSING_ERROR, "Failed to write image to " + path);
        }
    } catch (const cv::Exception& e) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "Failed to write image to " + path + ": " + e.what());
    }
    return Result::ok();
}

}
