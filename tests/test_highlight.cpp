#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>

#include <unistd.h>

#include "../src/core/types.hpp"
#include "../src/highlight/cache.hpp"
#include "../src/highlight/highlighter.hpp"
#include "../src/highlight/syntax.hpp"
#include "../src/highlight/theme.hpp"

using namespace codevis;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

namespace {

std::filesystem::path temp_dir(const std::string& tag) {
    auto dir = std::filesystem::temp_directory_path() /
               ("codevis_" + tag + "_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    return dir;
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::shared_ptr<const Theme> solarized() {
    std::shared_ptr<const Theme> theme;
    Result r = ThemeSet::load_defaults().find("Solarized (dark)", theme);
    assert(r.success());
    return theme;
}

std::shared_ptr<const SyntaxSet> default_syntaxes() {
    return std::make_shared<SyntaxSet>(SyntaxSet::load_defaults());
}

std::string joined(const std::vector<StyledSpan>& spans) {
    std::string s;
    for (const auto& span : spans) s += std::string(span.text);
    return s;
}

}

TEST(theme_not_found_lists_names) {
    ThemeSet themes = ThemeSet::load_defaults();
    assert(themes.size() >= 4);

    std::shared_ptr<const Theme> theme;
    Result r = themes.find("No Such Theme", theme);
    assert(r.error == ErrorCode::THEME_NOT_FOUND);
    assert(!theme);
    assert(r.message.find("No Such Theme") != std::string::npos);
    for (const auto& name : themes.names()) {
        assert(r.message.find("\"" + name + "\"") != std::string::npos);
    }
}

TEST(theme_loaded_from_toml) {
    auto dir = temp_dir("themes");
    write_file(dir / "paper.toml",
               "name = \"Paper\"\n"
               "foreground = \"#101010\"\n"
               "background = \"#fafafa\"\n"
               "[tokens]\n"
               "keyword = \"#aa0000\"\n"
               "comment = \"#00aa00\"\n");
    write_file(dir / "notes.txt", "ignored");

    ThemeSet themes = ThemeSet::load_defaults();
    const std::size_t before = themes.size();
    assert(themes.load_directory(dir.string()).success());
    assert(themes.size() == before + 1);

    std::shared_ptr<const Theme> paper;
    assert(themes.find("Paper", paper).success());
    assert(paper->background == Color(0xfa, 0xfa, 0xfa));
    assert(paper->style_for(TokenKind::Keyword).foreground == Color(0xaa, 0, 0));
    assert(paper->style_for(TokenKind::Comment).foreground == Color(0, 0xaa, 0));
    assert(paper->style_for(TokenKind::Number).foreground == Color(0x10, 0x10, 0x10));

    write_file(dir / "broken.toml", "[tokens]\nbogus = \"#000000\"\n");
    assert(themes.load_file((dir / "broken.toml").string()).error == ErrorCode::INVALID_FORMAT);
    assert(themes.load_file((dir / "missing.toml").string()).error == ErrorCode::FILE_NOT_FOUND);

    std::filesystem::remove_all(dir);
}

TEST(directory_scan_skips_unreadable_entries) {
    // Links whose target is gone cannot be stat'ed; they must not abort the scan.
    auto theme_dir = temp_dir("dangling_themes");
    write_file(theme_dir / "ink.toml",
               "name = \"Ink\"\n"
               "foreground = \"#eeeeee\"\n"
               "background = \"#111111\"\n");
    std::filesystem::create_symlink(theme_dir / "gone.toml", theme_dir / "zz_dangling.toml");

    ThemeSet themes = ThemeSet::load_defaults();
    assert(themes.load_directory(theme_dir.string()).success());
    std::shared_ptr<const Theme> ink;
    assert(themes.find("Ink", ink).success());
    assert(ink->background == Color(0x11, 0x11, 0x11));

    auto syntax_dir = temp_dir("dangling_syntaxes");
    write_file(syntax_dir / "rb.toml",
               "name = \"Ruby\"\n"
               "extensions = [\"rb\"]\n"
               "line_comments = [\"#\"]\n");
    std::filesystem::create_symlink(syntax_dir / "gone.toml", syntax_dir / "zz_dangling.toml");

    SyntaxSet syntaxes = SyntaxSet::load_defaults();
    assert(syntaxes.load_directory(syntax_dir.string()).success());
    std::shared_ptr<const SyntaxDefinition> ruby;
    assert(syntaxes.find_syntax_for_file("app.rb", "", ruby).success());
    assert(ruby && ruby->name == "Ruby");

    std::filesystem::remove_all(theme_dir);
    std::filesystem::remove_all(syntax_dir);
}

TEST(syntax_lookup_order) {
    auto syntaxes = default_syntaxes();
    std::shared_ptr<const SyntaxDefinition> syntax;

    assert(syntaxes->find_syntax_for_file("src/main.cpp", "", syntax).success());
    assert(syntax && syntax->name == "C++");

    // Extensions compare case-insensitively.
    assert(syntaxes->find_syntax_for_file("LEGACY.PY", "", syntax).success());
    assert(syntax && syntax->name == "Python");

    assert(syntaxes->find_syntax_for_file("build/Makefile", "", syntax).success());
    assert(syntax && syntax->name == "Makefile");

    assert(syntaxes->find_syntax_for_file("scripts/deploy", "#!/usr/bin/env bash", syntax).success());
    assert(syntax && syntax->name == "Shell");

    assert(syntaxes->find_syntax_for_file("data.unknown", "hello", syntax).success());
    assert(!syntax);
}

TEST(syntax_lookup_without_file_name_fails) {
    auto syntaxes = default_syntaxes();
    std::shared_ptr<const SyntaxDefinition> syntax;
    assert(syntaxes->find_syntax_for_file("", "", syntax).error == ErrorCode::SYNTAX_LOOKUP_ERROR);
    assert(syntaxes->find_syntax_for_file("some/dir/..", "", syntax).error == ErrorCode::SYNTAX_LOOKUP_ERROR);
}

TEST(syntax_loaded_from_toml) {
    auto dir = temp_dir("syntaxes");
    write_file(dir / "lua.toml",
               "name = \"Lua\"\n"
               "extensions = [\"lua\"]\n"
               "keywords = [\"local\", \"function\", \"end\"]\n"
               "line_comments = [\"--\"]\n"
               "block_comment = [\"--[[\", \"]]\"]\n");
    write_file(dir / "bad_regex.toml",
               "name = \"Bad\"\n"
               "first_line_match = \"([\"\n");

    SyntaxSet syntaxes = SyntaxSet::load_defaults();
    assert(syntaxes.load_file((dir / "lua.toml").string()).success());
    assert(syntaxes.load_file((dir / "bad_regex.toml").string()).error == ErrorCode::INVALID_FORMAT);

    std::shared_ptr<const SyntaxDefinition> syntax;
    assert(syntaxes.find_syntax_for_file("init.lua", "", syntax).success());
    assert(syntax && syntax->name == "Lua");
    assert(syntax->keywords.count("local") == 1);
    assert(syntax->has_block_comments());

    std::filesystem::remove_all(dir);
}

TEST(highlighter_classifies_tokens) {
    auto theme = solarized();
    auto syntaxes = default_syntaxes();
    Highlighter hl(syntaxes->find_syntax_by_name("C++"), theme);

    std::vector<StyledSpan> spans;
    const std::string line = "return 42; // done";
    assert(hl.highlight_line(line, spans).success());
    assert(joined(spans) == line);
    assert(spans.front().text == "return");
    assert(spans.front().style == theme->style_for(TokenKind::Keyword));
    assert(spans.back().text == "// done");
    assert(spans.back().style == theme->style_for(TokenKind::Comment));

    bool saw_number = false;
    for (const auto& span : spans) {
        if (span.text == "42") {
            saw_number = true;
            assert(span.style == theme->style_for(TokenKind::Number));
        }
    }
    assert(saw_number);
}

TEST(block_comment_spans_lines_until_reset) {
    auto theme = solarized();
    Highlighter hl(default_syntaxes()->find_syntax_by_name("C++"), theme);
    const Style comment = theme->style_for(TokenKind::Comment);

    std::vector<StyledSpan> spans;
    assert(hl.highlight_line("int x; /* open", spans).success());
    assert(spans.back().style == comment);

    assert(hl.highlight_line("still inside", spans).success());
    assert(spans.size() == 1);
    assert(spans[0].style == comment);

    hl.reset();
    assert(hl.highlight_line("int y;", spans).success());
    assert(spans.front().text == "int");
    assert(spans.front().style == theme->style_for(TokenKind::Type));
}

TEST(plain_highlighter_single_span) {
    auto theme = solarized();
    Highlighter hl(nullptr, theme);
    assert(hl.is_plain());

    std::vector<StyledSpan> spans;
    assert(hl.highlight_line("int x = 1;", spans).success());
    assert(spans.size() == 1);
    assert(spans[0].style == theme->style_for(TokenKind::Text));

    assert(hl.highlight_line("", spans).success());
    assert(spans.empty());

    Highlighter no_theme(nullptr, nullptr);
    assert(no_theme.highlight_line("x", spans).error == ErrorCode::HIGHLIGHT_ERROR);
}

TEST(cache_reuses_matching_syntax) {
    HighlightCache cache(default_syntaxes(), solarized());
    std::optional<Highlighter> hl;

    assert(cache.highlighter_for_file_name("a.cpp", "", hl).success());
    assert(hl.has_value());
    assert(hl->syntax()->name == "C++");

    // Same syntax again: keep the current highlighter.
    assert(cache.highlighter_for_file_name("b.hpp", "", hl).success());
    assert(!hl.has_value());

    assert(cache.highlighter_for_file_name("c.rs", "", hl).success());
    assert(hl.has_value() && hl->syntax()->name == "Rust");

    // No syntax at all resolves to the plain highlighter.
    assert(cache.highlighter_for_file_name("notes.xyz", "", hl).success());
    assert(hl.has_value() && hl->is_plain());

    Highlighter plain = cache.new_plain_highlighter();
    assert(plain.is_plain());
    assert(cache.highlighter_for_file_name("d.cpp", "", hl).success());
    assert(hl.has_value());

    assert(cache.highlighter_for_file_name("", "", hl).error == ErrorCode::SYNTAX_LOOKUP_ERROR);
}

TEST(cache_copies_are_independent) {
    HighlightCache original(default_syntaxes(), solarized());
    std::optional<Highlighter> hl;
    assert(original.highlighter_for_file_name("a.cpp", "", hl).success());
    assert(hl.has_value());

    HighlightCache clone = original;
    assert(clone.highlighter_for_file_name("b.cpp", "", hl).success());
    assert(!hl.has_value());

    assert(clone.highlighter_for_file_name("c.py", "", hl).success());
    assert(hl.has_value());
    // The original still remembers C++.
    assert(original.highlighter_for_file_name("d.cpp", "", hl).success());
    assert(!hl.has_value());
    assert(&clone.syntaxes() == &original.syntaxes());
}

int main() {
    std::cout << "=== Highlight Tests ===\n\n";

    std::cout << "--- Themes ---\n";
    RUN_TEST(theme_not_found_lists_names);
    RUN_TEST(theme_loaded_from_toml);
    RUN_TEST(directory_scan_skips_unreadable_entries);

    std::cout << "\n--- Syntaxes ---\n";
    RUN_TEST(syntax_lookup_order);
    RUN_TEST(syntax_lookup_without_file_name_fails);
    RUN_TEST(syntax_loaded_from_toml);

    std::cout << "\n--- Highlighter ---\n";
    RUN_TEST(highlighter_classifies_tokens);
    RUN_TEST(block_comment_spans_lines_until_reset);
    RUN_TEST(plain_highlighter_single_span);

    std::cout << "\n--- Cache ---\n";
    RUN_TEST(cache_reuses_matching_syntax);
    RUN_TEST(cache_copies_are_independent);

    std::cout << "\n" << (failures == 0 ? "All tests passed" : "Some tests FAILED") << "\n";
    return failures == 0 ? 0 : 1;
}
