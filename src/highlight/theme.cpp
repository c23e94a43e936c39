#include "highlight/theme.hpp"
#include <toml.hpp>

#include <algorithm>
#include <filesystem>
#include <sstream>

namespace codevis {

namespace {

Color hex(const char* text) {
    Color c;
    parse_color(text, c);
    return c;
}

struct Palette {
    const char* name;
    const char* foreground;
    const char* background;
    const char* keyword;
    const char* type;
    const char* string;
    const char* number;
    const char* comment;
    const char* punctuation;
    const char* preprocessor;
};

constexpr Palette kBuiltinPalettes[] = {
    {"Solarized (dark)", "#839496", "#002b36", "#859900", "#b58900", "#2aa198", "#d33682", "#586e75", "#93a1a1", "#cb4b16"},
    {"Solarized (light)", "#657b83", "#fdf6e3", "#859900", "#b58900", "#2aa198", "#d33682", "#93a1a1", "#586e75", "#cb4b16"},
    {"base16-ocean.dark", "#c0c5ce", "#2b303b", "#b48ead", "#ebcb8b", "#a3be8c", "#d08770", "#65737e", "#c0c5ce", "#96b5b4"},
    {"InspiredGitHub", "#323232", "#ffffff", "#a71d5d", "#0086b3", "#183691", "#0086b3", "#969896", "#323232", "#a71d5d"},
};

Theme from_palette(const Palette& p) {
    Theme theme = Theme::monochrome(p.name, hex(p.foreground), hex(p.background));
    theme.token_colors[static_cast<std::size_t>(TokenKind::Keyword)] = hex(p.keyword);
    theme.token_colors[static_cast<std::size_t>(TokenKind::Type)] = hex(p.type);
    theme.token_colors[static_cast<std::size_t>(TokenKind::String)] = hex(p.string);
    theme.token_colors[static_cast<std::size_t>(TokenKind::Number)] = hex(p.number);
    theme.token_colors[static_cast<std::size_t>(TokenKind::Comment)] = hex(p.comment);
    theme.token_colors[static_cast<std::size_t>(TokenKind::Punctuation)] = hex(p.punctuation);
    theme.token_colors[static_cast<std::size_t>(TokenKind::Preprocessor)] = hex(p.preprocessor);
    return theme;
}

bool token_kind_from_name(const std::string& name, TokenKind& out) {
    for (std::size_t i = 0; i < kTokenKindCount; ++i) {
        TokenKind kind = static_cast<TokenKind>(i);
        if (name == token_kind_name(kind)) {
            out = kind;
            return true;
        }
    }
    return false;
}

}

const char* token_kind_name(TokenKind kind) {
    switch (kind) {
        case TokenKind::Text: return "text";
        case TokenKind::Keyword: return "keyword";
        case TokenKind::Type: return "type";
        case TokenKind::String: return "string";
        case TokenKind::Number: return "number";
        case TokenKind::Comment: return "comment";
        case TokenKind::Punctuation: return "punctuation";
        case TokenKind::Preprocessor: return "preprocessor";
        case TokenKind::Count: break;
    }
    return "unknown";
}

Theme Theme::monochrome(const std::string& name, Color fg, Color bg) {
    Theme theme;
    theme.name = name;
    theme.foreground = fg;
    theme.background = bg;
    theme.token_colors.fill(fg);
    return theme;
}

ThemeSet ThemeSet::load_defaults() {
    ThemeSet set;
    for (const Palette& p : kBuiltinPalettes) {
        set.add(from_palette(p));
    }
    return set;
}

void ThemeSet::add(Theme theme) {
    std::string name = theme.name;
    themes_[name] = std::make_shared<const Theme>(std::move(theme));
}

Result ThemeSet::load_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(std::filesystem::path(path), ec) || ec) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "theme file not found: " + path);
    }

    try {
        auto tbl = toml::parse_file(path);

        Theme theme;
        if (auto v = tbl["name"].value<std::string>()) {
            theme.name = *v;
        } else {
            theme.name = std::filesystem::path(path).stem().string();
        }

        Color fg = theme.foreground;
        Color bg = theme.background;
        if (auto v = tbl["foreground"].value<std::string>()) {
            if (!parse_color(*v, fg)) {
                return Result::fail(ErrorCode::INVALID_FORMAT, path + ": invalid foreground color '" + *v + "'");
            }
        }
        if (auto v = tbl["background"].value<std::string>()) {
            if (!parse_color(*v, bg)) {
                return Result::fail(ErrorCode::INVALID_FORMAT, path + ": invalid background color '" + *v + "'");
            }
        }
        theme = Theme::monochrome(theme.name, fg, bg);

        if (auto tokens = tbl["tokens"].as_table()) {
            for (auto&& [key, node] : *tokens) {
                std::string token_name(key.str());
                TokenKind kind;
                if (!token_kind_from_name(token_name, kind)) {
                    return Result::fail(ErrorCode::INVALID_FORMAT, path + ": unknown token kind '" + token_name + "'");
                }
                auto value = node.value<std::string>();
                Color c;
                if (!value || !parse_color(*value, c)) {
                    return Result::fail(ErrorCode::INVALID_FORMAT, path + ": invalid color for '" + token_name + "'");
                }
                theme.token_colors[static_cast<std::size_t>(kind)] = c;
            }
        }

        add(std::move(theme));
        return Result::ok();
    } catch (const toml::parse_error& e) {
        std::ostringstream ss;
        ss << path << ": " << e.description();
        return Result::fail(ErrorCode::INVALID_FORMAT, ss.str());
    }
}

Result ThemeSet::load_directory(const std::string& dir) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(fs::path(dir), ec) || ec) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "theme directory not found: " + dir);
    }

    std::vector<std::string> files;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && it->path().extension() == ".toml") {
            files.push_back(it->path().string());
        }
    }
    if (ec) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "can not list theme directory " + dir + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        Result r = load_file(file);
        if (r.failure()) return r;
    }
    return Result::ok();
}

Result ThemeSet::find(const std::string& name, std::shared_ptr<const Theme>& out) const {
    auto it = themes_.find(name);
    if (it != themes_.end()) {
        out = it->second;
        return Result::ok();
    }

    std::ostringstream ss;
    ss << "Could not find theme \"" << name << "\", must be one of ";
    bool first = true;
    for (const auto& entry : themes_) {
        if (!first) ss << ", ";
        ss << "\"" << entry.first << "\"";
        first = false;
    }
    return Result::fail(ErrorCode::THEME_NOT_FOUND, ss.str());
}

std::vector<std::string> ThemeSet::names() const {
    std::vector<std::string> out;
    out.reserve(themes_.size());
    for (const auto& entry : themes_) {
        out.push_back(entry.first);
    }
    return out;
}

}
