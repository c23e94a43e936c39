#pragma once

#include "core/types.hpp"
#include "highlight/style.hpp"
#include <array>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace codevis {

enum class TokenKind {
    Text = 0,
    Keyword,
    Type,
    String,
    Number,
    Comment,
    Punctuation,
    Preprocessor,
    Count
};

constexpr std::size_t kTokenKindCount = static_cast<std::size_t>(TokenKind::Count);

const char* token_kind_name(TokenKind kind);

struct Theme {
    std::string name;
    Color foreground{200, 200, 200};
    Color background{0, 0, 0};
    std::array<Color, kTokenKindCount> token_colors{};

    // Every token kind uses the default foreground.
    static Theme monochrome(const std::string& name, Color fg, Color bg);

    Style style_for(TokenKind kind) const {
        return {token_colors[static_cast<std::size_t>(kind)], background};
    }
    Style default_style() const { return {foreground, background}; }
};

class ThemeSet {
public:
    ThemeSet() = default;

    static ThemeSet load_defaults();

    void add(Theme theme);
    Result load_file(const std::string& path);
    // Loads every *.toml file in `dir`. Returns the first failure.
    Result load_directory(const std::string& dir);

    // Fails with THEME_NOT_FOUND, listing every available theme name.
    Result find(const std::string& name, std::shared_ptr<const Theme>& out) const;

    std::vector<std::string> names() const;
    std::size_t size() const { return themes_.size(); }

private:
    std::map<std::string, std::shared_ptr<const Theme>> themes_;
};

}
