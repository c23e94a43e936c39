#include "core/types.hpp"
#include <cctype>

namespace codevis {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::FILE_NOT_FOUND: return "file not found";
        case ErrorCode::INVALID_FORMAT: return "invalid format";
        case ErrorCode::MEMORY_ERROR: return "memory error";
        case ErrorCode::PROCESSING_ERROR: return "processing error";
        case ErrorCode::INVALID_ARGUMENT: return "invalid argument";
        case ErrorCode::EMPTY_INPUT: return "empty input";
        case ErrorCode::NO_RENDERABLE_LINES: return "no renderable lines";
        case ErrorCode::INVALID_ASPECT_RATIO: return "invalid aspect ratio";
        case ErrorCode::THEME_NOT_FOUND: return "theme not found";
        case ErrorCode::SYNTAX_LOOKUP_ERROR: return "syntax lookup error";
        case ErrorCode::HIGHLIGHT_ERROR: return "highlight error";
        case ErrorCode::CANCELLED: return "cancelled";
    }
    return "unknown";
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}

}

bool parse_color(const std::string& text, Color& out) {
    std::string hex = text;
    if (!hex.empty() && hex[0] == '#') {
        hex.erase(0, 1);
    }
    if (hex.size() == 3) {
        std::string expanded;
        for (char c : hex) {
            expanded += c;
            expanded += c;
        }
        hex = expanded;
    }
    if (hex.size() != 6) return false;

    uint8_t channels[3];
    for (int i = 0; i < 3; ++i) {
        int hi = hex_value(hex[i * 2]);
        int lo = hex_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) return false;
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    out = Color(channels[0], channels[1], channels[2]);
    return true;
}

}
