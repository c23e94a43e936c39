#include "core/config.hpp"
#include "cli/args.hpp"
#include <toml.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <sstream>

#include <unistd.h>
#include <pwd.h>

namespace codevis {

namespace {

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
}

std::string get_config_home() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
}

bool read_color(const toml::node_view<toml::node>& node, const char* key,
                std::optional<Color>& out, std::string& error) {
    auto v = node[key].value<std::string>();
    if (!v) return true;
    if (v->empty() || *v == "none") {
        out.reset();
        return true;
    }
    Color c;
    if (!parse_color(*v, c)) {
        error = std::string("render.") + key + " is not a color: " + *v;
        return false;
    }
    out = c;
    return true;
}

}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_config_home() + "/codevis";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool parse_aspect_ratio(const std::string& text, double& out) {
    if (text.empty()) return false;
    const std::size_t sep = text.find_first_of(":/");
    char* end = nullptr;
    if (sep == std::string::npos) {
        double v = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size() || !std::isfinite(v) || v <= 0.0) return false;
        out = v;
        return true;
    }
    const std::string w = text.substr(0, sep);
    const std::string h = text.substr(sep + 1);
    if (w.empty() || h.empty()) return false;
    double wv = std::strtod(w.c_str(), &end);
    if (end != w.c_str() + w.size()) return false;
    double hv = std::strtod(h.c_str(), &end);
    if (end != h.c_str() + h.size()) return false;
    if (!std::isfinite(wv) || !std::isfinite(hv) || wv <= 0.0 || hv <= 0.0) return false;
    out = wv / hv;
    return true;
}

bool Config::validate(std::string& error) const {
    if (render.column_width < 1 || render.column_width > 4096) {
        error = "render.column_width must be between 1 and 4096";
        return false;
    }
    if (render.line_height < 1 || render.line_height > 64) {
        error = "render.line_height must be between 1 and 64";
        return false;
    }
    if (!std::isfinite(render.target_aspect_ratio) || render.target_aspect_ratio <= 0.0) {
        error = "render.aspect_ratio must be a positive number";
        return false;
    }
    if (render.thread_count > 1024) {
        error = "render.threads must be between 0 and 1024";
        return false;
    }
    if (!(render.color_modulation >= 0.0f && render.color_modulation <= 1.0f)) {
        error = "render.color_modulation must be between 0.0 and 1.0";
        return false;
    }
    if (render.theme_name.empty()) {
        error = "render.theme must not be empty";
        return false;
    }
    if (input.max_file_size == 0) {
        error = "input.max_file_size must be positive";
        return false;
    }
    if (output.path.empty()) {
        error = "output.path must not be empty";
        return false;
    }
    return true;
}

std::optional<Config> Config::load(const std::string& path, std::string* error) {
    auto fail = [error](const std::string& msg) -> std::optional<Config> {
        if (error) *error = msg;
        return std::nullopt;
    };

    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        return fail("Config file not found: " + path);
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["config_version"].value<int>()) {
            if (*v != CONFIG_VERSION) {
                return fail("Unsupported config_version " + std::to_string(*v));
            }
        }

        if (auto input = tbl["input"]) {
            if (auto v = input["path"].value<std::string>()) cfg.input.path = *v;
            if (auto v = input["max_file_size"].value<int64_t>()) {
                if (*v <= 0) return fail("input.max_file_size must be positive");
                cfg.input.max_file_size = static_cast<uint64_t>(*v);
            }
            if (auto v = input["include_hidden"].value<bool>()) cfg.input.include_hidden = *v;
        }

        if (auto output = tbl["output"]) {
            if (auto v = output["path"].value<std::string>()) cfg.output.path = *v;
        }

        if (auto render = tbl["render"]) {
            RenderConfig& r = cfg.render;
            if (auto v = render["column_width"].value<int>()) r.column_width = *v;
            if (auto v = render["line_height"].value<int>()) r.line_height = *v;
            if (auto v = render["aspect_ratio"].value<double>()) {
                r.target_aspect_ratio = *v;
            } else if (auto s = render["aspect_ratio"].value<std::string>()) {
                if (!parse_aspect_ratio(*s, r.target_aspect_ratio)) {
                    return fail("render.aspect_ratio is not a ratio: " + *s);
                }
            }
            if (auto v = render["threads"].value<int64_t>()) {
                if (*v < 0 || *v > 1024) return fail("render.threads must be between 0 and 1024");
                r.thread_count = static_cast<unsigned>(*v);
            }
            std::string color_error;
            if (!read_color(render, "fg_color", r.fg_color, color_error) ||
                !read_color(render, "bg_color", r.bg_color, color_error)) {
                return fail(color_error);
            }
            if (auto v = render["highlight_truncated_lines"].value<bool>()) r.highlight_truncated_lines = *v;
            if (auto v = render["show_current_file"].value<bool>()) r.show_current_file = *v;
            if (auto v = render["theme"].value<std::string>()) r.theme_name = *v;
            if (auto v = render["force_full_columns"].value<bool>()) r.force_full_columns = *v;
            if (auto v = render["plain"].value<bool>()) r.plain_mode = *v;
            if (auto v = render["ignore_files_without_syntax"].value<bool>()) r.skip_unsyntaxed_files = *v;
            if (auto v = render["color_modulation"].value<double>()) r.color_modulation = static_cast<float>(*v);
        }

        if (auto assets = tbl["assets"]) {
            if (auto v = assets["theme_dir"].value<std::string>()) cfg.assets.theme_dir = *v;
            if (auto v = assets["syntax_dir"].value<std::string>()) cfg.assets.syntax_dir = *v;
        }

        std::string reason;
        if (!cfg.validate(reason)) {
            return fail(path + ": " + reason);
        }

        return cfg;
    } catch (const toml::parse_error& e) {
        std::ostringstream ss;
        ss << path << ": " << e.description() << " at line " << e.source().begin.line;
        return fail(ss.str());
    }
}

std::optional<Config> Config::load_default(std::string* error) {
    std::string path = default_config_path();
    return load(path, error);
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (!args.input.empty()) config.input.path = args.input;
    if (!args.output.empty()) config.output.path = args.output;
    if (!args.theme_dir.empty()) config.assets.theme_dir = args.theme_dir;
    if (!args.syntax_dir.empty()) config.assets.syntax_dir = args.syntax_dir;
    if (!args.theme.empty()) config.render.theme_name = args.theme;

    if (args.column_width) config.render.column_width = *args.column_width;
    if (args.line_height) config.render.line_height = *args.line_height;
    if (args.aspect_ratio) config.render.target_aspect_ratio = *args.aspect_ratio;
    if (args.threads) config.render.thread_count = *args.threads;
    if (args.fg_color) config.render.fg_color = args.fg_color;
    if (args.bg_color) config.render.bg_color = args.bg_color;
    if (args.color_modulation) config.render.color_modulation = *args.color_modulation;

    if (args.highlight_truncated_lines) config.render.highlight_truncated_lines = true;
    if (args.show_current_file) config.render.show_current_file = true;
    if (args.force_full_columns) config.render.force_full_columns = true;
    if (args.plain) config.render.plain_mode = true;
    if (args.ignore_files_without_syntax) config.render.skip_unsyntaxed_files = true;

    return config;
}

}
