#pragma once

#include <cstdint>

namespace codevis {

struct Offset {
    int x = 0;
    int y = 0;

    bool operator==(const Offset& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Offset& other) const { return !(*this == other); }
};

// Top-left pixel of the line slot `line` in a column-major layout.
// Used by both render paths and by the trailing fill.
inline Offset calc_offsets(uint32_t line, uint32_t lines_per_column, int column_width, int line_height) {
    const uint32_t column = line / lines_per_column;
    const uint32_t row = line % lines_per_column;
    return {static_cast<int>(column) * column_width, static_cast<int>(row) * line_height};
}

}
