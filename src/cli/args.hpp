#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>

namespace codevis {

struct Args {
    std::string input;
    std::string output;
    std::string config_path;
    std::string theme;
    std::string theme_dir;
    std::string syntax_dir;

    std::optional<int> column_width;
    std::optional<int> line_height;
    std::optional<double> aspect_ratio;
    std::optional<unsigned> threads;
    std::optional<Color> fg_color;
    std::optional<Color> bg_color;
    std::optional<float> color_modulation;

    bool highlight_truncated_lines = false;
    bool show_current_file = false;
    bool force_full_columns = false;
    bool plain = false;
    bool ignore_files_without_syntax = false;

    bool list_themes = false;
    bool quiet = false;
    bool show_help = false;

    // First problem found on the command line; empty when parsing succeeded.
    std::string error;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
