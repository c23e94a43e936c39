#pragma once

#include "core/types.hpp"
#include "highlight/style.hpp"
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace codevis {

struct ChunkContext {
    int column_width = 100;
    int line_height = 2;
    bool highlight_truncated_lines = false;
    // Slot of the first line of this chunk within `target`.
    uint32_t line_num = 0;
    uint32_t lines_per_column = 1;
    std::optional<Color> fg_color;
    std::optional<Color> bg_color;
    // Used for lines that produce no spans.
    Color default_background{0, 0, 0};
    std::size_t file_index = 0;
    float color_modulation = 0.0f;
};

struct ChunkOutcome {
    uint32_t longest_line_in_chars = 0;
    std::optional<Color> background;
};

// Lines are '\n' separated; a trailing unterminated line counts, a final
// '\n' does not start another line.
uint32_t count_lines(std::string_view text);
std::string_view first_line(std::string_view text);

// Pixel rows needed to hold `line_count` lines in a buffer of its own.
// Fails with MEMORY_ERROR when that does not fit an image dimension.
Result chunk_rows(uint32_t line_count, int line_height, int& rows);

// Paints every line of `text` into `target` (CV_8UC3, RGB). Each character is
// a 1 pixel wide strip, line_height pixels tall; columns past column_width are
// dropped.
Result render_chunk(std::string_view text, cv::Mat& target, const HighlightFn& highlight,
                    const ChunkContext& ctx, ChunkOutcome& out);

}
