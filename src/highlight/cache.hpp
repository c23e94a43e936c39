#pragma once

#include "core/types.hpp"
#include "highlight/highlighter.hpp"
#include "highlight/syntax.hpp"
#include "highlight/theme.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace codevis {

// Hands out highlighters for files. Copying a cache yields an independent
// instance that shares the read-only syntax and theme data, which is how
// every render worker gets its own highlighting state.
class HighlightCache {
public:
    HighlightCache(std::shared_ptr<const SyntaxSet> syntaxes, std::shared_ptr<const Theme> theme);

    Highlighter new_plain_highlighter();

    // Leaves `out` empty when the file resolves to the syntax of the last
    // highlighter handed out, so the caller keeps using that one. Files without
    // a matching syntax get the plain highlighter.
    Result highlighter_for_file_name(const std::filesystem::path& path,
                                     std::string_view first_line,
                                     std::optional<Highlighter>& out);

    const SyntaxSet& syntaxes() const { return *syntaxes_; }
    const Theme& theme() const { return *theme_; }

private:
    std::shared_ptr<const SyntaxSet> syntaxes_;
    std::shared_ptr<const Theme> theme_;
    const SyntaxDefinition* current_ = nullptr;
};

}
