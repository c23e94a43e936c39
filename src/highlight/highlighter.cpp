#include "highlight/highlighter.hpp"
#include <cctype>

namespace codevis {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

bool is_word_start(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool is_word_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return !prefix.empty() && text.substr(0, prefix.size()) == prefix;
}

}

Highlighter::Highlighter(std::shared_ptr<const SyntaxDefinition> syntax, std::shared_ptr<const Theme> theme)
    : syntax_(std::move(syntax)), theme_(std::move(theme)) {}

void Highlighter::reset() {
    mode_ = Mode::Normal;
    quote_ = '\0';
}

void Highlighter::push(std::vector<StyledSpan>& spans, TokenKind kind, std::string_view text) const {
    if (text.empty()) return;
    Style style = theme_->style_for(kind);
    if (!spans.empty()) {
        StyledSpan& last = spans.back();
        if (last.style == style && last.text.data() + last.text.size() == text.data()) {
            last.text = std::string_view(last.text.data(), last.text.size() + text.size());
            return;
        }
    }
    spans.push_back({style, text});
}

std::size_t Highlighter::scan_string(std::string_view line, std::size_t pos) {
    while (pos < line.size()) {
        char c = line[pos];
        if (c == '\\') {
            pos += 2;
            continue;
        }
        if (c == quote_) {
            mode_ = Mode::Normal;
            return pos + 1;
        }
        ++pos;
    }
    return line.size();
}

bool Highlighter::starts_line_comment(std::string_view rest) const {
    for (const auto& marker : syntax_->line_comments) {
        if (starts_with(rest, marker)) return true;
    }
    return false;
}

Result Highlighter::highlight_line(std::string_view line, std::vector<StyledSpan>& spans) {
    spans.clear();
    if (!theme_) {
        return Result::fail(ErrorCode::HIGHLIGHT_ERROR, "highlighter has no theme");
    }
    if (line.empty()) {
        return Result::ok();
    }
    if (!syntax_) {
        push(spans, TokenKind::Text, line);
        return Result::ok();
    }

    const std::size_t n = line.size();
    std::size_t pos = 0;
    bool at_line_start = true;

    while (pos < n) {
        if (mode_ == Mode::BlockComment) {
            std::size_t end = line.find(syntax_->block_comment_end, pos);
            if (end == std::string_view::npos) {
                push(spans, TokenKind::Comment, line.substr(pos));
                pos = n;
                break;
            }
            std::size_t stop = end + syntax_->block_comment_end.size();
            push(spans, TokenKind::Comment, line.substr(pos, stop - pos));
            pos = stop;
            mode_ = Mode::Normal;
            continue;
        }
        if (mode_ == Mode::String) {
            std::size_t stop = scan_string(line, pos);
            push(spans, TokenKind::String, line.substr(pos, stop - pos));
            pos = stop;
            continue;
        }

        const char c = line[pos];
        const std::string_view rest = line.substr(pos);

        if (is_space(c)) {
            std::size_t stop = pos;
            while (stop < n && is_space(line[stop])) ++stop;
            push(spans, TokenKind::Text, line.substr(pos, stop - pos));
            pos = stop;
            continue;
        }
        if (starts_line_comment(rest)) {
            push(spans, TokenKind::Comment, rest);
            break;
        }
        if (syntax_->has_block_comments() && starts_with(rest, syntax_->block_comment_start)) {
            push(spans, TokenKind::Comment, line.substr(pos, syntax_->block_comment_start.size()));
            pos += syntax_->block_comment_start.size();
            mode_ = Mode::BlockComment;
            at_line_start = false;
            continue;
        }
        if (at_line_start && syntax_->preprocessor != '\0' && c == syntax_->preprocessor) {
            std::size_t stop = pos + 1;
            while (stop < n && is_space(line[stop])) ++stop;
            while (stop < n && is_word_char(line[stop])) ++stop;
            push(spans, TokenKind::Preprocessor, line.substr(pos, stop - pos));
            pos = stop;
            at_line_start = false;
            continue;
        }
        at_line_start = false;

        if (syntax_->string_quotes.find(c) != std::string::npos) {
            quote_ = c;
            mode_ = Mode::String;
            std::size_t stop = scan_string(line, pos + 1);
            push(spans, TokenKind::String, line.substr(pos, stop - pos));
            pos = stop;
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            std::size_t stop = pos + 1;
            while (stop < n && (is_word_char(line[stop]) || line[stop] == '.')) ++stop;
            push(spans, TokenKind::Number, line.substr(pos, stop - pos));
            pos = stop;
            continue;
        }
        if (is_word_start(c)) {
            std::size_t stop = pos + 1;
            while (stop < n && is_word_char(line[stop])) ++stop;
            std::string word(line.substr(pos, stop - pos));
            TokenKind kind = TokenKind::Text;
            if (syntax_->keywords.count(word)) {
                kind = TokenKind::Keyword;
            } else if (syntax_->types.count(word)) {
                kind = TokenKind::Type;
            }
            push(spans, kind, line.substr(pos, stop - pos));
            pos = stop;
            continue;
        }

        push(spans, TokenKind::Punctuation, line.substr(pos, 1));
        ++pos;
    }

    if (mode_ == Mode::String && !syntax_->multiline_strings) {
        mode_ = Mode::Normal;
    }
    return Result::ok();
}

}
