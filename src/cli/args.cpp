#include "args.hpp"
#include "core/config.hpp"
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <cstdio>

namespace codevis {

static bool parse_int(const char* text, long min_val, long max_val, long& out) {
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0') return false;
    if (v < min_val || v > max_val) return false;
    out = v;
    return true;
}

static bool parse_float(const char* text, float min_val, float max_val, float& out) {
    char* end = nullptr;
    float v = std::strtof(text, &end);
    if (end == text || *end != '\0') return false;
    if (!(v >= min_val && v <= max_val)) return false;
    out = v;
    return true;
}

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    auto fail = [&args](const std::string& msg) {
        if (args.error.empty()) args.error = msg;
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        const char* arg = argv[i];

        auto next = [&](const char* name) -> const char* {
            if (i + 1 < argc) return argv[++i];
            fail(std::string(name) + " requires a value");
            return nullptr;
        };

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            if (const char* v = next(arg)) {
                args.output = v;
                if (!validate_path(args.output)) fail("Invalid output path");
            }
        }
        else if (strcmp(arg, "--config") == 0) {
            if (const char* v = next(arg)) {
                args.config_path = v;
                if (!validate_path(args.config_path)) fail("Invalid config path");
            }
        }
        else if (strcmp(arg, "--column-width") == 0) {
            long v;
            if (const char* s = next(arg)) {
                if (parse_int(s, 1, 4096, v)) args.column_width = static_cast<int>(v);
                else fail("--column-width must be an integer between 1 and 4096");
            }
        }
        else if (strcmp(arg, "--line-height") == 0) {
            long v;
            if (const char* s = next(arg)) {
                if (parse_int(s, 1, 64, v)) args.line_height = static_cast<int>(v);
                else fail("--line-height must be an integer between 1 and 64");
            }
        }
        else if (strcmp(arg, "--aspect") == 0) {
            double v;
            if (const char* s = next(arg)) {
                if (parse_aspect_ratio(s, v)) args.aspect_ratio = v;
                else fail(std::string("--aspect expects W:H or a positive number, got ") + s);
            }
        }
        else if (strcmp(arg, "-t") == 0 || strcmp(arg, "--threads") == 0) {
            long v;
            if (const char* s = next(arg)) {
                if (parse_int(s, 0, 1024, v)) args.threads = static_cast<unsigned>(v);
                else fail("--threads must be an integer between 0 and 1024");
            }
        }
        else if (strcmp(arg, "--fg-color") == 0 || strcmp(arg, "--bg-color") == 0) {
            const bool fg = arg[2] == 'f';
            if (const char* s = next(arg)) {
                Color c;
                if (!parse_color(s, c)) fail(std::string(arg) + " expects #rrggbb, got " + s);
                else if (fg) args.fg_color = c;
                else args.bg_color = c;
            }
        }
        else if (strcmp(arg, "--color-modulation") == 0) {
            float v;
            if (const char* s = next(arg)) {
                if (parse_float(s, 0.0f, 1.0f, v)) args.color_modulation = v;
                else fail("--color-modulation must be between 0.0 and 1.0");
            }
        }
        else if (strcmp(arg, "--theme") == 0) {
            if (const char* s = next(arg)) args.theme = s;
        }
        else if (strcmp(arg, "--theme-dir") == 0) {
            if (const char* s = next(arg)) args.theme_dir = s;
        }
        else if (strcmp(arg, "--syntax-dir") == 0) {
            if (const char* s = next(arg)) args.syntax_dir = s;
        }
        else if (strcmp(arg, "--highlight-truncated-lines") == 0) {
            args.highlight_truncated_lines = true;
        }
        else if (strcmp(arg, "--show-current-file") == 0) {
            args.show_current_file = true;
        }
        else if (strcmp(arg, "--force-full-columns") == 0) {
            args.force_full_columns = true;
        }
        else if (strcmp(arg, "--plain") == 0) {
            args.plain = true;
        }
        else if (strcmp(arg, "--ignore-files-without-syntax") == 0) {
            args.ignore_files_without_syntax = true;
        }
        else if (strcmp(arg, "--list-themes") == 0) {
            args.list_themes = true;
        }
        else if (strcmp(arg, "-q") == 0 || strcmp(arg, "--quiet") == 0) {
            args.quiet = true;
        }
        else if (arg[0] == '-' && arg[1] != '\0') {
            fail(std::string("Unknown option: ") + arg);
        }
        else if (args.input.empty()) {
            args.input = arg;
        }
        else {
            fail(std::string("Unexpected argument: ") + arg);
        }
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] <INPUT_DIR>\n\n", prog);
    printf("INPUT_DIR:\n");
    printf("  Directory (walked recursively) or single file to render\n\n");
    printf("OPTIONS:\n");
    printf("  -o, --output <FILE>          Output image (default: output.png)\n");
    printf("      --config <FILE>          Config file path (default: platform-specific)\n");
    printf("      --column-width <N>       Pixels per column (default: 100, range: 1-4096)\n");
    printf("      --line-height <N>        Pixel rows per line (default: 2, range: 1-64)\n");
    printf("      --aspect <W:H>           Target aspect ratio (default: 16:9)\n");
    printf("  -t, --threads <N>            Render threads, 0 = all cores (default: 0)\n");
    printf("      --fg-color <#RRGGBB>     Paint every character in this color\n");
    printf("      --bg-color <#RRGGBB>     Paint every background in this color\n");
    printf("      --highlight-truncated-lines  Highlight whole lines before cutting them\n");
    printf("      --show-current-file      Log each file as it is rendered\n");
    printf("      --theme <NAME>           Color theme (default: \"Solarized (dark)\")\n");
    printf("      --force-full-columns     Only use layouts where every column is full\n");
    printf("      --plain                  Skip syntax highlighting\n");
    printf("      --ignore-files-without-syntax  Leave out files no syntax matches\n");
    printf("      --color-modulation <N>   Per-file hue variation (0.0-1.0)\n");
    printf("      --theme-dir <DIR>        Load extra *.toml themes\n");
    printf("      --syntax-dir <DIR>       Load extra *.toml syntax definitions\n");
    printf("      --list-themes            Print available themes and exit\n");
    printf("  -q, --quiet                  Only print warnings and errors\n");
    printf("  -h, --help                   Show this help\n");
    printf("\nCONFIG FILE:\n");
    printf("  Default location: $XDG_CONFIG_HOME/codevis/config.toml\n");
    printf("                    (~/.config/codevis/config.toml when unset)\n");
}

}
