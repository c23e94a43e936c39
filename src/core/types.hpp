#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

namespace codevis {

enum class ErrorCode {
    SUCCESS = 0,
    FILE_NOT_FOUND,
    INVALID_FORMAT,
    MEMORY_ERROR,
    PROCESSING_ERROR,
    INVALID_ARGUMENT,
    EMPTY_INPUT,
    NO_RENDERABLE_LINES,
    INVALID_ASPECT_RATIO,
    THEME_NOT_FOUND,
    SYNTAX_LOOKUP_ERROR,
    HIGHLIGHT_ERROR,
    CANCELLED
};

const char* error_code_name(ErrorCode code);

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }
    // User-requested abort, not an internal failure.
    bool cancelled() const { return error == ErrorCode::CANCELLED; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

struct Color {
    uint8_t r = 0, g = 0, b = 0;

    Color() = default;
    Color(uint8_t r, uint8_t g, uint8_t b) : r(r), g(g), b(b) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    std::string to_hex() const {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
        return std::string(buf);
    }
};

// Accepts "#rrggbb", "rrggbb" or "#rgb".
bool parse_color(const std::string& text, Color& out);

}
