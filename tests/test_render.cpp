#include <iostream>
#include <cassert>
#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/core/progress.hpp"
#include "../src/highlight/syntax.hpp"
#include "../src/highlight/theme.hpp"
#include "../src/render/canvas.hpp"
#include "../src/render/render.hpp"

using namespace codevis;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

namespace {

// Collects every info message from the whole span tree.
class CapturingProgress : public Progress {
public:
    CapturingProgress() : messages_(std::make_shared<std::vector<std::string>>()) {}
    explicit CapturingProgress(std::shared_ptr<std::vector<std::string>> sink) : messages_(std::move(sink)) {}

    std::unique_ptr<Progress> add_child(const std::string&) override {
        return std::make_unique<CapturingProgress>(messages_);
    }
    void set_name(const std::string&) override {}
    void init(std::optional<std::size_t>, const std::string&) override {}
    void inc_by(std::size_t) override {}
    void info(const std::string& message) override { messages_->push_back(message); }
    void show_throughput(std::chrono::steady_clock::time_point) override {}

    bool saw(const std::string& needle) const {
        for (const auto& m : *messages_) {
            if (m.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    std::shared_ptr<std::vector<std::string>> messages_;
};

std::shared_ptr<const SyntaxSet> syntaxes() {
    static auto set = std::make_shared<const SyntaxSet>(SyntaxSet::load_defaults());
    return set;
}

const ThemeSet& themes() {
    static const ThemeSet set = ThemeSet::load_defaults();
    return set;
}

std::vector<SourceUnit> mixed_units(std::size_t count) {
    std::vector<SourceUnit> units;
    for (std::size_t i = 0; i < count; ++i) {
        SourceUnit u;
        switch (i % 4) {
            case 0:
                u.path = "src/file" + std::to_string(i) + ".cpp";
                u.text = "#include <vector>\nint f(int x) {\n\treturn x * " + std::to_string(i) +
                         "; // twice\n}\n/* left open\n";
                break;
            case 1:
                u.path = "lib/mod" + std::to_string(i) + ".py";
                u.text = "def g(y):\n    return \"s\" + y  # comment\n";
                break;
            case 2:
                u.path = "docs/notes" + std::to_string(i) + ".unknownext";
                u.text = "plain words here\n\nand more after a blank line " + std::string(i, 'z');
                break;
            default:
                u.path = "src/other" + std::to_string(i) + ".cpp";
                u.text = "still not a comment */ int y = 0;\nconst char* s = \"caf\xc3\xa9\";\n";
                break;
        }
        units.push_back(std::move(u));
    }
    return units;
}

RenderConfig small_config() {
    RenderConfig cfg;
    cfg.column_width = 24;
    cfg.line_height = 2;
    cfg.target_aspect_ratio = 1.0;
    cfg.theme_name = "Solarized (dark)";
    return cfg;
}

bool same_pixels(const Canvas& a, const Canvas& b) {
    if (a.width() != b.width() || a.height() != b.height()) return false;
    for (int y = 0; y < a.height(); ++y) {
        for (int x = 0; x < a.width(); ++x) {
            if (a.get_pixel(x, y) != b.get_pixel(x, y)) return false;
        }
    }
    return true;
}

bool same_rows(const Canvas& a, int a_row, const Canvas& b, int b_row, int rows) {
    if (a.width() != b.width()) return false;
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < a.width(); ++x) {
            if (a.get_pixel(x, a_row + y) != b.get_pixel(x, b_row + y)) return false;
        }
    }
    return true;
}

// Runs the worker path even on a single core machine.
Result render_threads(const std::vector<SourceUnit>& units, Progress& progress,
                      const std::atomic<bool>& stop, const RenderConfig& cfg, unsigned threads,
                      Canvas& out, RenderStats* stats = nullptr) {
    return detail::render_on_threads(units, progress, stop, syntaxes(), themes(), cfg, threads, out, stats);
}

}

TEST(sequential_and_parallel_match) {
    std::vector<SourceUnit> units = mixed_units(37);
    std::atomic<bool> stop{false};

    for (float modulation : {0.0f, 0.6f}) {
        RenderConfig cfg = small_config();
        cfg.color_modulation = modulation;

        NullProgress progress;
        Canvas seq, par;
        RenderStats seq_stats, par_stats;

        cfg.thread_count = 1;
        Result r = render(units, progress, stop, syntaxes(), themes(), cfg, seq, &seq_stats);
        assert(r.success());
        r = render_threads(units, progress, stop, cfg, 4, par, &par_stats);
        assert(r.success());
        assert(seq_stats.threads_used == 1);
        assert(par_stats.threads_used == 4);

        assert(seq_stats.stage == RenderStage::Done);
        assert(par_stats.stage == RenderStage::Done);
        assert(seq_stats.layout.column_count == par_stats.layout.column_count);
        assert(seq_stats.rendered_files == units.size());
        assert(par_stats.rendered_files == units.size());
        assert(seq_stats.rendered_lines == par_stats.rendered_lines);
        assert(seq_stats.longest_line_chars == par_stats.longest_line_chars);
        assert(same_pixels(seq, par));
    }
}

TEST(no_lines_fails_before_allocation) {
    std::atomic<bool> stop{false};
    NullProgress progress;
    Canvas canvas;
    RenderStats stats;

    std::vector<SourceUnit> units{{"a.cpp", ""}, {"b.py", ""}};
    Result r = render(units, progress, stop, syntaxes(), themes(), small_config(), canvas, &stats);
    assert(r.error == ErrorCode::NO_RENDERABLE_LINES);
    assert(r.message.find("2 files") != std::string::npos);
    assert(stats.stage == RenderStage::Planning);
    assert(canvas.empty());

    r = render({}, progress, stop, syntaxes(), themes(), small_config(), canvas, &stats);
    assert(r.error == ErrorCode::NO_RENDERABLE_LINES);
    assert(canvas.empty());
}

TEST(unknown_theme_is_reported) {
    std::atomic<bool> stop{false};
    NullProgress progress;
    Canvas canvas;
    RenderConfig cfg = small_config();
    cfg.theme_name = "Nope";

    Result r = render(mixed_units(3), progress, stop, syntaxes(), themes(), cfg, canvas);
    assert(r.error == ErrorCode::THEME_NOT_FOUND);
    assert(r.message.find("Solarized (dark)") != std::string::npos);
    assert(canvas.empty());
}

TEST(invalid_aspect_ratio_is_reported) {
    std::atomic<bool> stop{false};
    NullProgress progress;
    Canvas canvas;
    RenderConfig cfg = small_config();
    cfg.target_aspect_ratio = -2.0;

    Result r = render(mixed_units(3), progress, stop, syntaxes(), themes(), cfg, canvas);
    assert(r.error == ErrorCode::INVALID_ASPECT_RATIO);
    assert(canvas.empty());
}

TEST(cancel_before_start_sequential) {
    std::atomic<bool> stop{true};
    NullProgress progress;
    Canvas canvas;
    RenderStats stats;
    RenderConfig cfg = small_config();
    cfg.thread_count = 1;

    Result r = render(mixed_units(100), progress, stop, syntaxes(), themes(), cfg, canvas, &stats);
    assert(r.cancelled());
    assert(stats.stage == RenderStage::Cancelled);
    assert(stats.rendered_files == 0);
    assert(canvas.empty());
}

TEST(cancel_before_start_parallel) {
    std::atomic<bool> stop{true};
    NullProgress progress;
    Canvas canvas;
    RenderStats stats;

    Result r = render_threads(mixed_units(100), progress, stop, small_config(), 4, canvas, &stats);
    assert(r.cancelled());
    assert(stats.threads_used == 4);
    assert(stats.stage == RenderStage::Cancelled);
    assert(stats.rendered_files < 100);
    // The flag is only looked at after a finished file has been placed.
    assert(stats.rendered_files >= 1);
    assert(canvas.empty());
}

TEST(skipped_files_leave_no_trace) {
    std::atomic<bool> stop{false};
    RenderConfig cfg;
    cfg.column_width = 10;
    cfg.line_height = 1;
    cfg.target_aspect_ratio = 5.0;
    cfg.skip_unsyntaxed_files = true;

    std::vector<SourceUnit> with_unknown{
        {"a.cpp", "int a;\nint b;\nint c;\n"},
        {"b.unknownext", "one\ntwo\nthree\nfour\nfive\n"},
        {"c.cpp", "int d;\nint e;\n"},
    };
    std::vector<SourceUnit> without_unknown{with_unknown[0], with_unknown[2]};

    for (unsigned threads : {1u, 3u}) {
        CapturingProgress progress;
        Canvas skipped, reference;
        RenderStats stats;

        assert(render_threads(with_unknown, progress, stop, cfg, threads, skipped, &stats).success());
        // Two files survive planning, so at most two workers start.
        assert(stats.threads_used == std::min(threads, 2u));
        assert(stats.ignored_files == 1);
        assert(stats.rendered_lines == 5);
        assert(progress.saw("Ignored 1 files due to missing syntax"));

        // Five lines at 5:1 make two columns of three, so one slot is padding.
        assert(stats.layout.column_count == 2);
        assert(stats.layout.lines_per_column == 3);

        NullProgress quiet;
        assert(render_threads(without_unknown, quiet, stop, cfg, threads, reference).success());
        assert(same_pixels(skipped, reference));

        std::shared_ptr<const Theme> theme;
        assert(themes().find(cfg.theme_name, theme).success());
        for (int x = 10; x < 20; ++x) {
            assert(skipped.get_pixel(x, 2) == theme->background);
        }
    }
}

TEST(trailing_fill_uses_background_override) {
    std::atomic<bool> stop{false};
    NullProgress progress;
    Canvas canvas;
    RenderStats stats;
    RenderConfig cfg;
    cfg.column_width = 4;
    cfg.line_height = 1;
    cfg.target_aspect_ratio = 4.0;
    cfg.bg_color = Color(9, 8, 7);

    std::vector<SourceUnit> units{{"a.txt", "aaaa\nbbbb\ncccc\n"}};
    assert(render(units, progress, stop, syntaxes(), themes(), cfg, canvas, &stats).success());
    // Three lines at 4:1 with four-pixel columns: two columns of two lines.
    assert(stats.layout.column_count == 2);
    assert(stats.layout.lines_per_column == 2);
    for (int x = 4; x < 8; ++x) {
        assert(canvas.get_pixel(x, 1) == Color(9, 8, 7));
    }
    assert(stats.longest_line_chars == 4);
}

TEST(plain_mode_uses_default_colors) {
    std::atomic<bool> stop{false};
    NullProgress progress;
    Canvas canvas;
    RenderConfig cfg;
    cfg.column_width = 8;
    cfg.line_height = 1;
    cfg.target_aspect_ratio = 8.0;
    cfg.plain_mode = true;
    cfg.thread_count = 1;

    std::vector<SourceUnit> units{{"k.cpp", "return x"}};
    assert(render(units, progress, stop, syntaxes(), themes(), cfg, canvas).success());

    std::shared_ptr<const Theme> theme;
    assert(themes().find(cfg.theme_name, theme).success());
    assert(canvas.get_pixel(0, 0) == theme->style_for(TokenKind::Text).foreground);
    assert(canvas.get_pixel(6, 0) == theme->background);
}

TEST(worker_error_is_surfaced) {
    std::atomic<bool> stop{false};
    std::vector<SourceUnit> units = mixed_units(12);
    // A path without a file name cannot be resolved to a syntax.
    units[7].path = "";

    for (unsigned threads : {1u, 4u}) {
        NullProgress progress;
        Canvas canvas;
        RenderStats stats;
        Result r = render_threads(units, progress, stop, small_config(), threads, canvas, &stats);
        assert(r.error == ErrorCode::SYNTAX_LOOKUP_ERROR);
        assert(stats.threads_used == threads);
        assert(canvas.empty());
    }
}

TEST(open_comment_does_not_leak_into_next_file) {
    std::atomic<bool> stop{false};
    RenderConfig cfg;
    cfg.column_width = 16;
    cfg.line_height = 1;
    // Tall target: everything lands in one column.
    cfg.target_aspect_ratio = 0.01;

    const SourceUnit opener{"a.cpp", "int a;\n/* never closed\n"};
    const SourceUnit follower{"b.cpp", "int b = 1;\nreturn b;\n"};

    for (unsigned threads : {1u, 2u}) {
        NullProgress progress;
        Canvas both, alone;
        RenderStats both_stats, alone_stats;

        assert(render_threads({opener, follower}, progress, stop, cfg, threads, both, &both_stats).success());
        assert(render_threads({follower}, progress, stop, cfg, threads, alone, &alone_stats).success());
        assert(both_stats.threads_used == threads);
        assert(both_stats.layout.column_count == 1);
        assert(alone_stats.layout.column_count == 1);

        // Rows 2 and 3 of the pair hold the second file.
        assert(same_rows(both, 2, alone, 0, 2));
    }

    // The open comment really does colour following lines of the same file.
    NullProgress progress;
    Canvas merged, follower_only;
    const SourceUnit merged_unit{"a.cpp", opener.text + follower.text};
    assert(render_threads({merged_unit}, progress, stop, cfg, 1, merged).success());
    assert(render_threads({follower}, progress, stop, cfg, 1, follower_only).success());
    assert(!same_rows(merged, 2, follower_only, 0, 2));
}

TEST(progress_reports_summary) {
    std::atomic<bool> stop{false};
    CapturingProgress progress;
    Canvas canvas;
    RenderConfig cfg = small_config();
    cfg.show_current_file = true;
    std::vector<SourceUnit> units = mixed_units(5);

    assert(render(units, progress, stop, syntaxes(), themes(), cfg, canvas).success());
    assert(progress.saw("Image dimensions"));
    assert(progress.saw("Longest encountered line in chars"));
    assert(progress.saw(units[3].path.string()));
}

int main() {
    std::cout << "=== Render Orchestrator Tests ===\n\n";

    RUN_TEST(sequential_and_parallel_match);
    RUN_TEST(no_lines_fails_before_allocation);
    RUN_TEST(unknown_theme_is_reported);
    RUN_TEST(invalid_aspect_ratio_is_reported);
    RUN_TEST(cancel_before_start_sequential);
    RUN_TEST(cancel_before_start_parallel);
    RUN_TEST(skipped_files_leave_no_trace);
    RUN_TEST(trailing_fill_uses_background_override);
    RUN_TEST(plain_mode_uses_default_colors);
    RUN_TEST(worker_error_is_surfaced);
    RUN_TEST(open_comment_does_not_leak_into_next_file);
    RUN_TEST(progress_reports_summary);

    std::cout << "\n" << (failures == 0 ? "All tests passed" : "Some tests FAILED") << "\n";
    return failures == 0 ? 0 : 1;
}
