#pragma once

#include "core/types.hpp"
#include <functional>
#include <string_view>
#include <vector>

namespace codevis {

struct Style {
    Color foreground{255, 255, 255};
    Color background{0, 0, 0};

    bool operator==(const Style& other) const {
        return foreground == other.foreground && background == other.background;
    }
};

// A run of text within one line. `text` views the line handed to the highlighter.
struct StyledSpan {
    Style style;
    std::string_view text;
};

// Highlights one line (without its terminator) into ordered spans.
using HighlightFn = std::function<Result(std::string_view line, std::vector<StyledSpan>& spans)>;

}
