#include "core/types.hpp"
#include "core/config.hpp"
#include "core/progress.hpp"
#include "highlight/syntax.hpp"
#include "highlight/theme.hpp"
#include "io/image_writer.hpp"
#include "io/source_loader.hpp"
#include "render/canvas.hpp"
#include "render/render.hpp"
#include "cli/args.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <vector>

#include <signal.h>

namespace codevis {
namespace {

std::atomic<bool> g_should_interrupt{false};

void handle_sigint(int) {
    g_should_interrupt.store(true);
}

void install_signal_handler() {
    struct sigaction sa {};
    sa.sa_handler = handle_sigint;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
}

}
}

int main(int argc, char* argv[]) {
    codevis::Args args = codevis::parse_args(argc, argv);

    if (args.show_help) {
        codevis::print_help(argv[0]);
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        return 2;
    }

    codevis::Config config = codevis::Config::defaults();
    if (!args.config_path.empty()) {
        std::string load_error;
        auto loaded = codevis::Config::load(args.config_path, &load_error);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << load_error << "\n";
            return 1;
        }
        config = *loaded;
    } else if (std::filesystem::exists(codevis::Config::default_config_path())) {
        std::string load_error;
        if (auto loaded_default = codevis::Config::load_default(&load_error)) {
            config = *loaded_default;
        } else {
            std::cerr << "Warning: Ignoring default config: " << load_error << "\n";
        }
    }
    config = codevis::apply_cli_overrides(config, args);

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    codevis::ThemeSet themes = codevis::ThemeSet::load_defaults();
    if (!config.assets.theme_dir.empty()) {
        codevis::Result r = themes.load_directory(config.assets.theme_dir);
        if (r.failure()) {
            std::cerr << "Error: " << r.message << "\n";
            return 1;
        }
    }

    if (args.list_themes) {
        for (const auto& name : themes.names()) {
            std::cout << name << "\n";
        }
        return 0;
    }

    if (config.input.path.empty()) {
        std::cerr << "Error: No input specified\n";
        codevis::print_help(argv[0]);
        return 1;
    }

    auto syntaxes = std::make_shared<codevis::SyntaxSet>(codevis::SyntaxSet::load_defaults());
    if (!config.assets.syntax_dir.empty()) {
        codevis::Result r = syntaxes->load_directory(config.assets.syntax_dir);
        if (r.failure()) {
            std::cerr << "Error: " << r.message << "\n";
            return 1;
        }
    }

    codevis::LogProgress progress("codevis", args.quiet);
    codevis::install_signal_handler();

    auto load_start = std::chrono::steady_clock::now();
    std::vector<codevis::SourceUnit> units;
    codevis::LoadOptions load_options;
    load_options.max_file_size = config.input.max_file_size;
    load_options.include_hidden = config.input.include_hidden;
    codevis::LoadStats load_stats;
    {
        auto read_progress = progress.add_child("read files");
        codevis::Result r = codevis::load_sources(config.input.path, load_options, units, &load_stats);
        if (r.failure()) {
            std::cerr << "Error: " << r.message << "\n";
            return 1;
        }
        read_progress->init(units.size(), "files");
        read_progress->inc_by(units.size());
        read_progress->show_throughput(load_start);
        if (load_stats.skipped_binary + load_stats.skipped_large > 0) {
            read_progress->info("Skipped " + std::to_string(load_stats.skipped_binary) + " binary and " +
                                std::to_string(load_stats.skipped_large) + " oversized files");
        }
    }

    codevis::Canvas canvas;
    codevis::RenderStats stats;
    codevis::Result r = codevis::render(units, progress, codevis::g_should_interrupt, syntaxes, themes,
                                        config.render, canvas, &stats);
    if (r.cancelled()) {
        std::cerr << "Cancelled by user\n";
        return 130;
    }
    if (r.failure()) {
        std::cerr << "Error: " << r.message << "\n";
        return 1;
    }

    auto write_start = std::chrono::steady_clock::now();
    r = codevis::write_image(canvas, config.output.path);
    if (r.failure()) {
        std::cerr << "Error: " << r.message << "\n";
        return 1;
    }
    if (!args.quiet) {
        double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - write_start).count();
        std::cerr << std::fixed << std::setprecision(2)
                  << "[PERF] wrote " << config.output.path
                  << " (" << stats.layout.image_width << "x" << stats.layout.image_height
                  << ") in " << seconds << "s\n";
    }

    return 0;
}
