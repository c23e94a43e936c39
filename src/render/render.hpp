#pragma once

#include "core/progress.hpp"
#include "core/types.hpp"
#include "highlight/syntax.hpp"
#include "highlight/theme.hpp"
#include "render/canvas.hpp"
#include "render/dimension.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codevis {

struct RenderConfig {
    int column_width = 100;
    int line_height = 2;
    double target_aspect_ratio = 16.0 / 9.0;
    // 0 uses every hardware thread; values below 2 render sequentially.
    unsigned thread_count = 0;
    std::optional<Color> fg_color;
    std::optional<Color> bg_color;
    bool highlight_truncated_lines = false;
    bool show_current_file = false;
    std::string theme_name = "Solarized (dark)";
    bool force_full_columns = false;
    bool plain_mode = false;
    bool skip_unsyntaxed_files = false;
    float color_modulation = 0.0f;
};

struct SourceUnit {
    std::filesystem::path path;
    std::string text;
};

enum class RenderStage {
    Init,
    Planning,
    Allocating,
    Rendering,
    Filling,
    Done,
    Cancelled
};

const char* render_stage_name(RenderStage stage);

struct RenderStats {
    RenderStage stage = RenderStage::Init;
    Layout layout;
    uint32_t longest_line_chars = 0;
    std::size_t ignored_files = 0;
    std::size_t rendered_files = 0;
    uint64_t rendered_lines = 0;
    // 1 for the sequential path, otherwise the number of workers started.
    unsigned threads_used = 0;
    std::optional<Color> background;
};

// Renders every unit into one image laid out in columns. Units are placed in
// order, each starting on the slot right after the previous one. On success
// `out` holds the finished image; on failure it is released.
//
// `should_interrupt` is polled between files. When it is set the call returns
// CANCELLED once every worker has stopped.
Result render(const std::vector<SourceUnit>& units,
              Progress& progress,
              const std::atomic<bool>& should_interrupt,
              std::shared_ptr<const SyntaxSet> syntaxes,
              const ThemeSet& themes,
              const RenderConfig& config,
              Canvas& out,
              RenderStats* stats = nullptr);

namespace detail {

// Same as render(), but runs `threads` workers regardless of how many cores
// the machine has. The count is still capped at the number of files.
Result render_on_threads(const std::vector<SourceUnit>& units,
                         Progress& progress,
                         const std::atomic<bool>& should_interrupt,
                         std::shared_ptr<const SyntaxSet> syntaxes,
                         const ThemeSet& themes,
                         const RenderConfig& config,
                         unsigned threads,
                         Canvas& out,
                         RenderStats* stats = nullptr);

}

}
