#include "render/dimension.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <vector>

namespace codevis {

namespace {

struct Candidate {
    uint32_t columns = 0;
    uint32_t lines_per_column = 0;
    double distance = std::numeric_limits<double>::infinity();
};

double aspect_for(uint32_t columns, uint32_t lines_per_column, int column_width, int line_height) {
    double width = static_cast<double>(columns) * column_width;
    double height = static_cast<double>(lines_per_column) * line_height;
    return width / height;
}

uint32_t ceil_div(uint32_t a, uint32_t b) {
    return static_cast<uint32_t>((static_cast<uint64_t>(a) + b - 1) / b);
}

Candidate search_padded(const DimensionRequest& req, Progress* progress) {
    Candidate best;
    const uint32_t total = req.total_line_count;
    for (uint32_t columns = 1; columns <= total; ++columns) {
        const uint32_t lines = ceil_div(total, columns);
        const double aspect = aspect_for(columns, lines, req.column_width, req.line_height);
        const double distance = std::abs(aspect - req.target_aspect_ratio);
        if (progress) progress->inc();
        if (distance < best.distance) {
            best = {columns, lines, distance};
        }
        // The aspect ratio grows strictly with the column count, so nothing
        // past the first candidate at or above the target can be closer.
        if (aspect >= req.target_aspect_ratio) break;
    }
    return best;
}

Candidate search_exact(const DimensionRequest& req, Progress* progress) {
    const uint32_t total = req.total_line_count;
    std::vector<uint32_t> divisors;
    for (uint64_t i = 1; i * i <= total; ++i) {
        if (total % i == 0) {
            divisors.push_back(static_cast<uint32_t>(i));
            if (i * i != total) {
                divisors.push_back(static_cast<uint32_t>(total / i));
            }
        }
    }
    std::sort(divisors.begin(), divisors.end());

    Candidate best;
    for (uint32_t columns : divisors) {
        const uint32_t lines = total / columns;
        const double distance = std::abs(aspect_for(columns, lines, req.column_width, req.line_height) -
                                         req.target_aspect_ratio);
        if (progress) progress->inc();
        if (distance < best.distance) {
            best = {columns, lines, distance};
        }
    }
    return best;
}

}

Result compute_dimensions(const DimensionRequest& request, Layout& out, Progress* progress) {
    if (!std::isfinite(request.target_aspect_ratio) || request.target_aspect_ratio <= 0.0) {
        std::ostringstream ss;
        ss << "Target aspect ratio must be a positive number, got " << request.target_aspect_ratio;
        return Result::fail(ErrorCode::INVALID_ASPECT_RATIO, ss.str());
    }
    if (request.total_line_count == 0) {
        return Result::fail(ErrorCode::EMPTY_INPUT, "Cannot lay out an image for zero lines");
    }
    if (request.column_width <= 0 || request.line_height <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "column width and line height must be positive");
    }

    if (progress) {
        progress->init(std::nullopt, "candidates");
    }

    Candidate best = request.force_full_columns ? search_exact(request, progress)
                                                : search_padded(request, progress);
    if (best.columns == 0) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "no column layout candidate found");
    }

    const int64_t width = static_cast<int64_t>(best.columns) * request.column_width;
    const int64_t height = static_cast<int64_t>(best.lines_per_column) * request.line_height;
    if (width > std::numeric_limits<int>::max() || height > std::numeric_limits<int>::max()) {
        std::ostringstream ss;
        ss << "Image of " << width << " x " << height << " pixels exceeds the supported size";
        return Result::fail(ErrorCode::MEMORY_ERROR, ss.str());
    }

    out.image_width = static_cast<int>(width);
    out.image_height = static_cast<int>(height);
    out.lines_per_column = best.lines_per_column;
    out.column_count = best.columns;
    return Result::ok();
}

}
