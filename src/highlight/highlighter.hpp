#pragma once

#include "core/types.hpp"
#include "highlight/style.hpp"
#include "highlight/syntax.hpp"
#include "highlight/theme.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace codevis {

// Line-at-a-time tokenizer bound to one syntax and theme. Block comments and
// (where the syntax allows it) strings carry over to the next line, so an
// instance must not be shared between threads.
class Highlighter {
public:
    // A null syntax produces the plain highlighter: one span per line in the
    // theme's default colors.
    Highlighter(std::shared_ptr<const SyntaxDefinition> syntax, std::shared_ptr<const Theme> theme);

    Result highlight_line(std::string_view line, std::vector<StyledSpan>& spans);
    void reset();

    const SyntaxDefinition* syntax() const { return syntax_.get(); }
    bool is_plain() const { return syntax_ == nullptr; }
    Color background() const { return theme_ ? theme_->background : Color(); }

private:
    enum class Mode { Normal, BlockComment, String };

    void push(std::vector<StyledSpan>& spans, TokenKind kind, std::string_view text) const;
    std::size_t scan_string(std::string_view line, std::size_t pos);
    bool starts_line_comment(std::string_view rest) const;

    std::shared_ptr<const SyntaxDefinition> syntax_;
    std::shared_ptr<const Theme> theme_;
    Mode mode_ = Mode::Normal;
    char quote_ = '\0';
};

}
