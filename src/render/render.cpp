#include "render/render.hpp"
#include "core/color_space.hpp"
#include "highlight/cache.hpp"
#include "render/chunk.hpp"
#include "render/offsets.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace codevis {

const char* render_stage_name(RenderStage stage) {
    switch (stage) {
        case RenderStage::Init:       return "init";
        case RenderStage::Planning:   return "planning";
        case RenderStage::Allocating: return "allocating";
        case RenderStage::Rendering:  return "rendering";
        case RenderStage::Filling:    return "filling";
        case RenderStage::Done:       return "done";
        case RenderStage::Cancelled:  return "cancelled";
    }
    return "unknown";
}

namespace {

struct PlannedFile {
    const SourceUnit* unit = nullptr;
    uint32_t line_count = 0;
    // Global index of the first line of this file.
    uint32_t line_offset = 0;
};

struct RenderedFile {
    std::size_t index = 0;
    cv::Mat pixels;
    ChunkOutcome outcome;
    Result result;
};

// Bounded hand-off from workers to the collector. Closing wakes every blocked
// sender; anything sent afterwards is dropped.
class ResultChannel {
public:
    explicit ResultChannel(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

    bool send(RenderedFile item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) return false;
        queue_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Returns false once every sender is gone and the queue is drained.
    bool receive(RenderedFile& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return !queue_.empty() || senders_ == 0 || closed_; });
        if (queue_.empty()) return false;
        item = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return true;
    }

    void add_sender() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++senders_;
    }

    void remove_sender() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (senders_ > 0) --senders_;
        not_empty_.notify_all();
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        queue_.clear();
        not_full_.notify_all();
        not_empty_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<RenderedFile> queue_;
    std::size_t capacity_;
    std::size_t senders_ = 0;
    bool closed_ = false;
};

// Hands out indices 0..count-1, each exactly once, smallest first.
std::size_t claim_next(std::atomic<std::size_t>& cursor, std::size_t count) {
    std::size_t current = cursor.load(std::memory_order_relaxed);
    while (current < count) {
        if (cursor.compare_exchange_weak(current, current + 1, std::memory_order_relaxed)) {
            return current;
        }
    }
    return count;
}

// Each file starts with fresh highlighter state. A highlighter is only
// rebuilt when the syntax changes.
Result select_highlighter(HighlightCache& cache, const PlannedFile& file, bool plain_mode,
                          std::optional<Highlighter>& current) {
    if (plain_mode) {
        if (!current) {
            current.emplace(cache.new_plain_highlighter());
        } else {
            current->reset();
        }
        return Result::ok();
    }

    std::optional<Highlighter> next;
    Result r = cache.highlighter_for_file_name(file.unit->path, first_line(file.unit->text), next);
    if (r.failure()) return r;
    if (next) {
        current = std::move(next);
    } else if (!current) {
        current.emplace(cache.new_plain_highlighter());
    } else {
        current->reset();
    }
    return Result::ok();
}

ChunkContext make_context(const RenderConfig& config, const Theme& theme, std::size_t file_index) {
    ChunkContext ctx;
    ctx.column_width = config.column_width;
    ctx.line_height = config.line_height;
    ctx.highlight_truncated_lines = config.highlight_truncated_lines;
    ctx.fg_color = config.fg_color;
    ctx.bg_color = config.bg_color;
    ctx.default_background = theme.background;
    ctx.file_index = file_index;
    ctx.color_modulation = config.color_modulation;
    return ctx;
}

// Calls fn(first_line, line_count, x, y) for every run of consecutive slots
// that sit in the same column.
template <typename Fn>
void for_each_column_run(uint32_t first, uint32_t count, const Layout& layout,
                         int column_width, int line_height, Fn&& fn) {
    uint32_t done = 0;
    while (done < count) {
        const uint32_t slot = first + done;
        const Offset off = calc_offsets(slot, layout.lines_per_column, column_width, line_height);
        const uint32_t row = slot % layout.lines_per_column;
        const uint32_t run = std::min(count - done, layout.lines_per_column - row);
        fn(done, run, off.x, off.y);
        done += run;
    }
}

void composite(const RenderedFile& file, const PlannedFile& planned, const Layout& layout,
               const RenderConfig& config, cv::Mat& canvas) {
    const int lh = config.line_height;
    const int cw = config.column_width;
    for_each_column_run(planned.line_offset, planned.line_count, layout, cw, lh,
        [&](uint32_t local, uint32_t run, int x, int y) {
            cv::Mat src = file.pixels.rowRange(static_cast<int>(local) * lh,
                                               static_cast<int>(local + run) * lh);
            src.copyTo(canvas(cv::Rect(x, y, cw, static_cast<int>(run) * lh)));
        });
}

std::string format_bytes(std::size_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " " << units[unit];
    return ss.str();
}

class RenderJob {
public:
    RenderJob(const std::vector<SourceUnit>& units, Progress& progress,
              const std::atomic<bool>& should_interrupt, std::shared_ptr<const SyntaxSet> syntaxes,
              const ThemeSet& themes, const RenderConfig& config, Canvas& out, RenderStats& stats)
        : units_(units), progress_(progress), should_interrupt_(should_interrupt),
          syntaxes_(std::move(syntaxes)), themes_(themes), config_(config), out_(out), stats_(stats) {}

    void force_threads(unsigned threads) { forced_threads_ = threads; }

    Result run() {
        ColorSpace::init();
        stats_.stage = RenderStage::Planning;

        if (!syntaxes_) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT, "no syntax set given");
        }
        Result r = themes_.find(config_.theme_name, theme_);
        if (r.failure()) return r;

        r = plan();
        if (r.failure()) return r;

        stats_.stage = RenderStage::Allocating;
        r = allocate();
        if (r.failure()) return r;

        stats_.stage = RenderStage::Rendering;
        const auto start = std::chrono::steady_clock::now();
        const unsigned threads = resolve_threads();
        stats_.threads_used = threads < 2 ? 1 : threads;
        r = threads < 2 ? render_sequential() : render_parallel(threads);
        if (r.failure()) {
            if (r.error == ErrorCode::CANCELLED) stats_.stage = RenderStage::Cancelled;
            return r;
        }
        line_progress_->show_throughput(start);

        stats_.stage = RenderStage::Filling;
        fill_trailing();

        stats_.stage = RenderStage::Done;
        std::ostringstream ss;
        ss << "Longest encountered line in chars: " << stats_.longest_line_chars;
        progress_.info(ss.str());
        if (stats_.ignored_files > 0) {
            ss.str("");
            ss << "Ignored " << stats_.ignored_files << " files due to missing syntax";
            progress_.info(ss.str());
        }
        return Result::ok();
    }

private:
    Result plan() {
        std::vector<uint32_t> counts(units_.size(), 0);
        const long n = static_cast<long>(units_.size());
#ifdef HAS_OPENMP
        #pragma omp parallel for schedule(dynamic, 16)
#endif
        for (long i = 0; i < n; ++i) {
            counts[static_cast<std::size_t>(i)] = count_lines(units_[static_cast<std::size_t>(i)].text);
        }

        uint64_t total = 0;
        for (std::size_t i = 0; i < units_.size(); ++i) {
            if (config_.skip_unsyntaxed_files) {
                std::shared_ptr<const SyntaxDefinition> syntax;
                Result r = syntaxes_->find_syntax_for_file(units_[i].path, first_line(units_[i].text), syntax);
                if (r.failure()) return r;
                if (!syntax) {
                    ++stats_.ignored_files;
                    continue;
                }
            }
            if (counts[i] == 0) continue;
            if (total + counts[i] > UINT32_MAX) {
                return Result::fail(ErrorCode::MEMORY_ERROR, "too many lines to lay out in one image");
            }
            files_.push_back({&units_[i], counts[i], static_cast<uint32_t>(total)});
            total += counts[i];
        }
        total_lines_ = static_cast<uint32_t>(total);

        if (total_lines_ == 0) {
            std::ostringstream ss;
            ss << "Did not find a single line to render in " << units_.size() << " files";
            return Result::fail(ErrorCode::NO_RENDERABLE_LINES, ss.str());
        }

        DimensionRequest request;
        request.target_aspect_ratio = config_.target_aspect_ratio;
        request.column_width = config_.column_width;
        request.line_height = config_.line_height;
        request.total_line_count = total_lines_;
        request.force_full_columns = config_.force_full_columns;

        auto dims_progress = progress_.add_child("determine dimensions");
        return compute_dimensions(request, stats_.layout, dims_progress.get());
    }

    Result allocate() {
        const Layout& layout = stats_.layout;
        Result r = out_.allocate(layout.image_width, layout.image_height);
        if (r.failure()) return r;

        std::ostringstream ss;
        ss << "Image dimensions: " << layout.image_width << " x " << layout.image_height
           << " (" << layout.column_count << " columns, " << layout.lines_per_column
           << " lines each) in " << format_bytes(out_.byte_size()) << " of virtual memory";
        progress_.info(ss.str());
        return Result::ok();
    }

    unsigned resolve_threads() const {
        if (forced_threads_) {
            const unsigned threads = std::max(1u, *forced_threads_);
            return static_cast<unsigned>(std::min<std::size_t>(threads, files_.size()));
        }
        unsigned hw = std::thread::hardware_concurrency();
        if (hw == 0) hw = 1;
        unsigned threads = config_.thread_count == 0 ? hw : config_.thread_count;
        threads = std::max(1u, std::min(threads, hw));
        return static_cast<unsigned>(std::min<std::size_t>(threads, files_.size()));
    }

    void start_progress() {
        file_progress_ = progress_.add_child("process");
        file_progress_->init(files_.size(), "files");
        line_progress_ = progress_.add_child("render");
        line_progress_->init(static_cast<std::size_t>(total_lines_), "lines");
    }

    void record(std::size_t index, const ChunkOutcome& outcome, uint32_t lines) {
        stats_.longest_line_chars = std::max(stats_.longest_line_chars, outcome.longest_line_in_chars);
        if (outcome.background && (!background_index_ || index >= *background_index_)) {
            stats_.background = outcome.background;
            background_index_ = index;
        }
        ++stats_.rendered_files;
        stats_.rendered_lines += lines;
        file_progress_->inc();
        line_progress_->inc_by(lines);
    }

    Result render_sequential() {
        start_progress();
        HighlightCache cache(syntaxes_, theme_);
        std::optional<Highlighter> highlighter;
        const HighlightFn highlight = [&highlighter](std::string_view line, std::vector<StyledSpan>& spans) {
            return highlighter->highlight_line(line, spans);
        };

        for (std::size_t i = 0; i < files_.size(); ++i) {
            if (should_interrupt_.load()) {
                return Result::fail(ErrorCode::CANCELLED, "render interrupted");
            }
            const PlannedFile& file = files_[i];
            if (config_.show_current_file) {
                file_progress_->info(file.unit->path.string());
            }

            Result r = select_highlighter(cache, file, config_.plain_mode, highlighter);
            if (r.failure()) return r;

            ChunkContext ctx = make_context(config_, *theme_, i);
            ctx.line_num = file.line_offset;
            ctx.lines_per_column = stats_.layout.lines_per_column;

            ChunkOutcome outcome;
            r = render_chunk(file.unit->text, out_.mat(), highlight, ctx, outcome);
            if (r.failure()) return r;
            record(i, outcome, file.line_count);
        }
        return Result::ok();
    }

    void work(HighlightCache cache, std::atomic<std::size_t>& cursor, const std::atomic<bool>& abort,
              ResultChannel& channel) const {
        std::optional<Highlighter> highlighter;
        const HighlightFn highlight = [&highlighter](std::string_view line, std::vector<StyledSpan>& spans) {
            return highlighter->highlight_line(line, spans);
        };

        while (!abort.load()) {
            const std::size_t index = claim_next(cursor, files_.size());
            if (index >= files_.size()) break;
            const PlannedFile& file = files_[index];

            RenderedFile rendered;
            rendered.index = index;
            rendered.result = select_highlighter(cache, file, config_.plain_mode, highlighter);
            int rows = 0;
            if (rendered.result.success()) {
                rendered.result = chunk_rows(file.line_count, config_.line_height, rows);
                if (rendered.result.failure()) {
                    rendered.result.message = file.unit->path.string() + ": " + rendered.result.message;
                }
            }
            if (rendered.result.success()) {
                try {
                    rendered.pixels.create(rows, config_.column_width, CV_8UC3);
                    ChunkContext ctx = make_context(config_, *theme_, index);
                    ctx.line_num = 0;
                    ctx.lines_per_column = file.line_count;
                    rendered.result = render_chunk(file.unit->text, rendered.pixels, highlight, ctx,
                                                   rendered.outcome);
                } catch (const std::exception& e) {
                    rendered.result = Result::fail(ErrorCode::MEMORY_ERROR,
                        "failed to render " + file.unit->path.string() + ": " + e.what());
                }
            }
            if (!channel.send(std::move(rendered))) break;
        }
        channel.remove_sender();
    }

    Result render_parallel(unsigned thread_count) {
        start_progress();
        std::ostringstream ss;
        ss << "Rendering " << files_.size() << " files on " << thread_count << " threads";
        progress_.info(ss.str());

        std::atomic<std::size_t> cursor{0};
        std::atomic<bool> abort{false};
        ResultChannel channel(thread_count * 2);
        const HighlightCache cache(syntaxes_, theme_);

        std::vector<std::thread> workers;
        workers.reserve(thread_count);
        for (unsigned t = 0; t < thread_count; ++t) {
            channel.add_sender();
            workers.emplace_back(&RenderJob::work, this, cache, std::ref(cursor), std::cref(abort),
                                 std::ref(channel));
        }

        Result result = Result::ok();
        RenderedFile rendered;
        while (channel.receive(rendered)) {
            if (rendered.result.failure()) {
                result = rendered.result;
                break;
            }
            const PlannedFile& file = files_[rendered.index];
            if (config_.show_current_file) {
                file_progress_->info(file.unit->path.string());
            }
            composite(rendered, file, stats_.layout, config_, out_.mat());
            record(rendered.index, rendered.outcome, file.line_count);

            if (should_interrupt_.load()) {
                result = Result::fail(ErrorCode::CANCELLED, "render interrupted");
                break;
            }
        }

        abort.store(true);
        channel.close();
        for (auto& worker : workers) {
            worker.join();
        }
        return result;
    }

    void fill_trailing() {
        const Layout& layout = stats_.layout;
        const uint32_t slots = layout.line_slots();
        if (total_lines_ >= slots) return;

        const Color fill = config_.bg_color.value_or(stats_.background.value_or(Color{0, 0, 0}));
        const cv::Scalar value(fill.r, fill.g, fill.b);
        const int cw = config_.column_width;
        const int lh = config_.line_height;
        cv::Mat& canvas = out_.mat();
        for_each_column_run(total_lines_, slots - total_lines_, layout, cw, lh,
            [&](uint32_t, uint32_t run, int x, int y) {
                canvas(cv::Rect(x, y, cw, static_cast<int>(run) * lh)).setTo(value);
            });
    }

    const std::vector<SourceUnit>& units_;
    Progress& progress_;
    const std::atomic<bool>& should_interrupt_;
    std::shared_ptr<const SyntaxSet> syntaxes_;
    const ThemeSet& themes_;
    const RenderConfig& config_;
    Canvas& out_;
    RenderStats& stats_;

    std::shared_ptr<const Theme> theme_;
    std::vector<PlannedFile> files_;
    uint32_t total_lines_ = 0;
    std::optional<std::size_t> background_index_;
    std::optional<unsigned> forced_threads_;
    std::unique_ptr<Progress> file_progress_;
    std::unique_ptr<Progress> line_progress_;
};

Result run_job(const std::vector<SourceUnit>& units, Progress& progress,
               const std::atomic<bool>& should_interrupt, std::shared_ptr<const SyntaxSet> syntaxes,
               const ThemeSet& themes, const RenderConfig& config, std::optional<unsigned> threads,
               Canvas& out, RenderStats* stats) {
    RenderStats local;
    RenderStats& s = stats ? *stats : local;
    s = RenderStats{};
    out.release();

    RenderJob job(units, progress, should_interrupt, std::move(syntaxes), themes, config, out, s);
    if (threads) job.force_threads(*threads);
    Result r = job.run();
    if (r.failure()) {
        out.release();
    }
    return r;
}

}

Result render(const std::vector<SourceUnit>& units,
              Progress& progress,
              const std::atomic<bool>& should_interrupt,
              std::shared_ptr<const SyntaxSet> syntaxes,
              const ThemeSet& themes,
              const RenderConfig& config,
              Canvas& out,
              RenderStats* stats) {
    return run_job(units, progress, should_interrupt, std::move(syntaxes), themes, config,
                   std::nullopt, out, stats);
}

namespace detail {

Result render_on_threads(const std::vector<SourceUnit>& units,
                         Progress& progress,
                         const std::atomic<bool>& should_interrupt,
                         std::shared_ptr<const SyntaxSet> syntaxes,
                         const ThemeSet& themes,
                         const RenderConfig& config,
                         unsigned threads,
                         Canvas& out,
                         RenderStats* stats) {
    return run_job(units, progress, should_interrupt, std::move(syntaxes), themes, config,
                   threads, out, stats);
}

}

}
