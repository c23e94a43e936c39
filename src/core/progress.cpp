#include "core/progress.hpp"
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace codevis {

namespace {

std::mutex& log_mutex() {
    static std::mutex mutex;
    return mutex;
}

}

LogProgress::LogProgress(std::string name, bool quiet)
    : name_(std::move(name)), quiet_(quiet) {}

std::unique_ptr<Progress> LogProgress::add_child(const std::string& name) {
    return std::make_unique<LogProgress>(name_ + "/" + name, quiet_);
}

void LogProgress::set_name(const std::string& name) {
    name_ = name;
}

void LogProgress::init(std::optional<std::size_t> total, const std::string& unit) {
    total_ = total;
    unit_ = unit;
    step_ = 0;
}

void LogProgress::inc_by(std::size_t n) {
    step_ += n;
}

void LogProgress::info(const std::string& message) {
    emit(message);
}

void LogProgress::show_throughput(std::chrono::steady_clock::time_point start) {
    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << step_;
    if (total_) {
        ss << "/" << *total_;
    }
    ss << " " << (unit_.empty() ? "items" : unit_) << " in " << seconds << "s";
    if (seconds > 0.0) {
        ss << " (" << std::setprecision(0) << (static_cast<double>(step_) / seconds)
           << " " << (unit_.empty() ? "items" : unit_) << "/s)";
    }
    emit(ss.str());
}

void LogProgress::emit(const std::string& line) const {
    if (quiet_) return;
    std::lock_guard<std::mutex> lock(log_mutex());
    std::cerr << "[" << name_ << "] " << line << "\n";
}

}
