#include "highlight/cache.hpp"

namespace codevis {

HighlightCache::HighlightCache(std::shared_ptr<const SyntaxSet> syntaxes, std::shared_ptr<const Theme> theme)
    : syntaxes_(std::move(syntaxes)), theme_(std::move(theme)) {}

Highlighter HighlightCache::new_plain_highlighter() {
    current_ = nullptr;
    return Highlighter(nullptr, theme_);
}

Result HighlightCache::highlighter_for_file_name(const std::filesystem::path& path,
                                                 std::string_view first_line,
                                                 std::optional<Highlighter>& out) {
    out.reset();
    std::shared_ptr<const SyntaxDefinition> syntax;
    Result r = syntaxes_->find_syntax_for_file(path, first_line, syntax);
    if (r.failure()) return r;

    if (syntax.get() == current_) {
        return Result::ok();
    }
    current_ = syntax.get();
    out.emplace(std::move(syntax), theme_);
    return Result::ok();
}

}
