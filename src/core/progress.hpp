#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace codevis {

// Observational progress sink. Nothing reported here affects rendering.
// A single instance is used from one thread at a time; children may be handed
// to other threads.
class Progress {
public:
    virtual ~Progress() = default;

    virtual std::unique_ptr<Progress> add_child(const std::string& name) = 0;
    virtual void set_name(const std::string& name) = 0;
    virtual void init(std::optional<std::size_t> total, const std::string& unit) = 0;
    virtual void inc_by(std::size_t n) = 0;
    virtual void info(const std::string& message) = 0;
    virtual void show_throughput(std::chrono::steady_clock::time_point start) = 0;

    void inc() { inc_by(1); }
};

// Writes "[name] message" lines to std::cerr.
class LogProgress : public Progress {
public:
    explicit LogProgress(std::string name, bool quiet = false);

    std::unique_ptr<Progress> add_child(const std::string& name) override;
    void set_name(const std::string& name) override;
    void init(std::optional<std::size_t> total, const std::string& unit) override;
    void inc_by(std::size_t n) override;
    void info(const std::string& message) override;
    void show_throughput(std::chrono::steady_clock::time_point start) override;

    std::size_t step() const { return step_; }

private:
    void emit(const std::string& line) const;

    std::string name_;
    std::string unit_;
    std::optional<std::size_t> total_;
    std::size_t step_ = 0;
    bool quiet_ = false;
};

class NullProgress : public Progress {
public:
    std::unique_ptr<Progress> add_child(const std::string&) override {
        return std::make_unique<NullProgress>();
    }
    void set_name(const std::string&) override {}
    void init(std::optional<std::size_t>, const std::string&) override {}
    void inc_by(std::size_t) override {}
    void info(const std::string&) override {}
    void show_throughput(std::chrono::steady_clock::time_point) override {}
};

}
