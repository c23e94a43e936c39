#pragma once

#include "core/types.hpp"
#include "core/progress.hpp"
#include <cstdint>

namespace codevis {

struct Layout {
    int image_width = 0;
    int image_height = 0;
    uint32_t lines_per_column = 0;
    uint32_t column_count = 0;

    uint32_t line_slots() const { return lines_per_column * column_count; }
    double aspect_ratio() const {
        return image_height > 0 ? static_cast<double>(image_width) / image_height : 0.0;
    }
};

struct DimensionRequest {
    double target_aspect_ratio = 16.0 / 9.0;
    int column_width = 100;
    int line_height = 2;
    uint32_t total_line_count = 0;
    bool force_full_columns = false;
};

// Picks the column count whose image aspect ratio is closest to the target.
// Ties go to the smaller column count. With force_full_columns only column
// counts that divide the line count exactly are considered.
Result compute_dimensions(const DimensionRequest& request, Layout& out, Progress* progress = nullptr);

}
