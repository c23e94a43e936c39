#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <filesystem>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace codevis {

struct SyntaxDefinition {
    std::string name;
    std::vector<std::string> extensions;   // lower case, without the dot
    std::vector<std::string> file_names;   // exact matches, e.g. "Makefile"
    std::string first_line_match;          // ECMAScript regex, empty for none
    std::unordered_set<std::string> keywords;
    std::unordered_set<std::string> types;
    std::vector<std::string> line_comments;
    std::string block_comment_start;
    std::string block_comment_end;
    std::string string_quotes = "\"'";
    bool multiline_strings = false;
    char preprocessor = '\0';

    bool has_block_comments() const {
        return !block_comment_start.empty() && !block_comment_end.empty();
    }
};

class SyntaxSet {
public:
    SyntaxSet() = default;

    static SyntaxSet load_defaults();

    Result add(SyntaxDefinition definition);
    Result load_file(const std::string& path);
    Result load_directory(const std::string& dir);

    // Resolves by exact file name, then extension, then the first line of the
    // file. `out` is null when nothing matches; that is not an error.
    Result find_syntax_for_file(const std::filesystem::path& path,
                                std::string_view first_line,
                                std::shared_ptr<const SyntaxDefinition>& out) const;

    std::shared_ptr<const SyntaxDefinition> find_syntax_by_name(const std::string& name) const;

    std::size_t size() const { return entries_.size(); }

private:
    struct Entry {
        std::shared_ptr<const SyntaxDefinition> definition;
        std::regex first_line;
        bool has_first_line = false;
    };

    std::vector<Entry> entries_;
};

}
