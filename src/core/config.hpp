#pragma once

#include "core/types.hpp"
#include "render/render.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace codevis {

constexpr int CONFIG_VERSION = 1;

struct ConfigInput {
    std::string path;
    uint64_t max_file_size = 8ull * 1024 * 1024;
    bool include_hidden = false;
};

struct ConfigOutput {
    std::string path = "output.png";
};

struct ConfigAssets {
    std::string theme_dir;
    std::string syntax_dir;
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigInput input;
    ConfigOutput output;
    RenderConfig render;
    ConfigAssets assets;

    std::string config_path;

    bool validate(std::string& error) const;

    static Config defaults();
    // Missing file, parse errors and out-of-range values all yield nullopt;
    // `error` receives the reason when given.
    static std::optional<Config> load(const std::string& path, std::string* error = nullptr);
    static std::optional<Config> load_default(std::string* error = nullptr);
    static std::string default_config_path();
    static std::string default_config_dir();
};

// Accepts "W:H", "W/H" or a plain positive number.
bool parse_aspect_ratio(const std::string& text, double& out);

Config apply_cli_overrides(Config config, const struct Args& args);

}
