#include "render/chunk.hpp"
#include "core/color_space.hpp"
#include "render/offsets.hpp"
#include <algorithm>
#include <climits>
#include <cstring>
#include <sstream>
#include <vector>

namespace codevis {

namespace {

constexpr int kTabWidth = 4;

std::size_t utf8_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1;
}

uint32_t count_chars(std::string_view line) {
    uint32_t chars = 0;
    for (std::size_t i = 0; i < line.size(); i += utf8_length(static_cast<unsigned char>(line[i]))) {
        ++chars;
    }
    return chars;
}

// Prefix of `line` holding at most `max_chars` characters.
std::string_view truncate_chars(std::string_view line, int max_chars) {
    std::size_t i = 0;
    for (int chars = 0; i < line.size() && chars < max_chars; ++chars) {
        i += utf8_length(static_cast<unsigned char>(line[i]));
    }
    return line.substr(0, std::min(i, line.size()));
}

std::string_view strip_cr(std::string_view line) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    return line;
}

inline cv::Vec3b to_vec(const Color& c) {
    return cv::Vec3b(c.r, c.g, c.b);
}

class ForegroundModulator {
public:
    ForegroundModulator(std::size_t file_index, float amount)
        : file_index_(file_index), amount_(amount) {}

    Color apply(const Color& c) {
        if (amount_ <= 0.0f) return c;
        if (!has_last_ || c != last_in_) {
            last_in_ = c;
            last_out_ = ColorSpace::modulate(c, file_index_, amount_);
            has_last_ = true;
        }
        return last_out_;
    }

private:
    std::size_t file_index_;
    float amount_;
    bool has_last_ = false;
    Color last_in_;
    Color last_out_;
};

}

uint32_t count_lines(std::string_view text) {
    if (text.empty()) return 0;
    uint32_t lines = static_cast<uint32_t>(std::count(text.begin(), text.end(), '\n'));
    if (text.back() != '\n') ++lines;
    return lines;
}

std::string_view first_line(std::string_view text) {
    std::size_t nl = text.find('\n');
    return strip_cr(nl == std::string_view::npos ? text : text.substr(0, nl));
}

Result chunk_rows(uint32_t line_count, int line_height, int& rows) {
    rows = 0;
    if (line_height <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "invalid line height");
    }
    const int64_t total = static_cast<int64_t>(line_count) * line_height;
    if (total > INT_MAX) {
        std::ostringstream ss;
        ss << line_count << " lines of " << line_height << " px do not fit in one buffer";
        return Result::fail(ErrorCode::MEMORY_ERROR, ss.str());
    }
    rows = static_cast<int>(total);
    return Result::ok();
}

Result render_chunk(std::string_view text, cv::Mat& target, const HighlightFn& highlight,
                    const ChunkContext& ctx, ChunkOutcome& out) {
    out = ChunkOutcome{};
    if (text.empty()) {
        return Result::ok();
    }
    if (target.type() != CV_8UC3) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "render target must be an 8-bit RGB image");
    }
    if (ctx.column_width <= 0 || ctx.line_height <= 0 || ctx.lines_per_column == 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "invalid chunk geometry");
    }

    const int cw = ctx.column_width;
    const std::size_t row_bytes = static_cast<std::size_t>(cw) * sizeof(cv::Vec3b);
    ForegroundModulator modulator(ctx.file_index, ctx.color_modulation);
    std::vector<StyledSpan> spans;

    uint32_t line_num = ctx.line_num;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t nl = text.find('\n', start);
        std::size_t end = (nl == std::string_view::npos) ? text.size() : nl;
        const std::string_view line = strip_cr(text.substr(start, end - start));
        start = (nl == std::string_view::npos) ? text.size() : nl + 1;

        const Offset off = calc_offsets(line_num, ctx.lines_per_column, cw, ctx.line_height);
        if (off.x + cw > target.cols || off.y + ctx.line_height > target.rows) {
            std::ostringstream ss;
            ss << "line slot " << line_num << " at (" << off.x << ", " << off.y
               << ") lies outside the " << target.cols << " x " << target.rows << " target";
            return Result::fail(ErrorCode::PROCESSING_ERROR, ss.str());
        }

        out.longest_line_in_chars = std::max(out.longest_line_in_chars, count_chars(line));

        const std::string_view to_highlight =
            ctx.highlight_truncated_lines ? line : truncate_chars(line, cw);
        Result r = highlight(to_highlight, spans);
        if (r.failure()) return r;

        cv::Vec3b* row = target.ptr<cv::Vec3b>(off.y) + off.x;
        Color line_bg = ctx.bg_color.value_or(ctx.default_background);
        int x = 0;

        for (const StyledSpan& span : spans) {
            if (x >= cw) break;
            out.background = span.style.background;
            const Color bg = ctx.bg_color.value_or(span.style.background);
            const cv::Vec3b fg_px = to_vec(modulator.apply(ctx.fg_color.value_or(span.style.foreground)));
            const cv::Vec3b bg_px = to_vec(bg);
            line_bg = bg;

            const std::string_view t = span.text;
            for (std::size_t i = 0; i < t.size() && x < cw; i += utf8_length(static_cast<unsigned char>(t[i]))) {
                const unsigned char ch = static_cast<unsigned char>(t[i]);
                if (ch == '\t') {
                    for (int k = 0; k < kTabWidth && x < cw; ++k) row[x++] = bg_px;
                } else if (ch <= ' ' || ch == 0x7F) {
                    row[x++] = bg_px;
                } else {
                    row[x++] = fg_px;
                }
            }
        }

        const cv::Vec3b fill_px = to_vec(line_bg);
        for (; x < cw; ++x) row[x] = fill_px;

        for (int h = 1; h < ctx.line_height; ++h) {
            std::memcpy(target.ptr<cv::Vec3b>(off.y + h) + off.x, row, row_bytes);
        }
        ++line_num;
    }
    return Result::ok();
}

}
