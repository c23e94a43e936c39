#include "highlight/syntax.hpp"
#include <toml.hpp>

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <iostream>
#include <sstream>

namespace codevis {

namespace {

std::string to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

SyntaxDefinition make_syntax(const std::string& name,
                             std::initializer_list<const char*> extensions,
                             std::initializer_list<const char*> keywords,
                             std::initializer_list<const char*> types,
                             std::initializer_list<const char*> line_comments,
                             const char* block_start = "",
                             const char* block_end = "") {
    SyntaxDefinition def;
    def.name = name;
    for (const char* e : extensions) def.extensions.emplace_back(e);
    for (const char* k : keywords) def.keywords.emplace(k);
    for (const char* t : types) def.types.emplace(t);
    for (const char* c : line_comments) def.line_comments.emplace_back(c);
    def.block_comment_start = block_start;
    def.block_comment_end = block_end;
    return def;
}

std::vector<SyntaxDefinition> builtin_syntaxes() {
    std::vector<SyntaxDefinition> out;

    auto cpp = make_syntax("C++", {"c", "h", "cc", "cpp", "cxx", "hpp", "hh", "hxx", "inl", "ipp"},
        {"alignas", "auto", "break", "case", "catch", "class", "const", "constexpr", "continue",
         "default", "delete", "do", "else", "enum", "explicit", "extern", "for", "friend", "goto",
         "if", "inline", "namespace", "new", "noexcept", "operator", "private", "protected",
         "public", "return", "sizeof", "static", "static_cast", "struct", "switch", "template",
         "this", "throw", "try", "typedef", "typename", "union", "using", "virtual", "volatile",
         "while", "true", "false", "nullptr"},
        {"bool", "char", "double", "float", "int", "long", "short", "signed", "unsigned", "void",
         "size_t", "int8_t", "int16_t", "int32_t", "int64_t", "uint8_t", "uint16_t", "uint32_t",
         "uint64_t", "string", "vector"},
        {"//"}, "/*", "*/");
    cpp.preprocessor = '#';
    out.push_back(cpp);

    auto rust = make_syntax("Rust", {"rs"},
        {"as", "async", "await", "break", "const", "continue", "crate", "dyn", "else", "enum",
         "extern", "fn", "for", "if", "impl", "in", "let", "loop", "match", "mod", "move", "mut",
         "pub", "ref", "return", "self", "Self", "static", "struct", "super", "trait", "type",
         "unsafe", "use", "where", "while", "true", "false"},
        {"bool", "char", "f32", "f64", "i8", "i16", "i32", "i64", "i128", "isize", "u8", "u16",
         "u32", "u64", "u128", "usize", "str", "String", "Vec", "Option", "Result", "Box"},
        {"//"}, "/*", "*/");
    rust.string_quotes = "\"";
    rust.multiline_strings = true;
    out.push_back(rust);

    auto python = make_syntax("Python", {"py", "pyi", "pyw"},
        {"and", "as", "assert", "async", "await", "break", "class", "continue", "def", "del",
         "elif", "else", "except", "finally", "for", "from", "global", "if", "import", "in", "is",
         "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try", "while", "with",
         "yield", "True", "False", "None"},
        {"int", "float", "str", "bytes", "list", "dict", "set", "tuple", "bool", "object"},
        {"#"});
    python.first_line_match = "^#!.*\\bpython[0-9.]*\\b";
    out.push_back(python);

    auto shell = make_syntax("Shell", {"sh", "bash", "zsh"},
        {"if", "then", "else", "elif", "fi", "for", "while", "until", "do", "done", "case", "esac",
         "in", "function", "return", "local", "export", "readonly", "set", "unset", "exit"},
        {}, {"#"});
    shell.file_names = {".bashrc", ".zshrc", ".profile"};
    shell.first_line_match = "^#!.*\\b(ba|z)?sh\\b";
    out.push_back(shell);

    auto js = make_syntax("JavaScript", {"js", "jsx", "mjs", "cjs", "ts", "tsx"},
        {"async", "await", "break", "case", "catch", "class", "const", "continue", "default",
         "delete", "do", "else", "export", "extends", "finally", "for", "function", "if",
         "import", "in", "instanceof", "let", "new", "return", "switch", "this", "throw", "try",
         "typeof", "var", "void", "while", "yield", "true", "false", "null", "undefined"},
        {"string", "number", "boolean", "any", "unknown", "never", "object"},
        {"//"}, "/*", "*/");
    js.string_quotes = "\"'`";
    js.first_line_match = "^#!.*\\bnode\\b";
    out.push_back(js);

    out.push_back(make_syntax("Go", {"go"},
        {"break", "case", "chan", "const", "continue", "default", "defer", "else", "fallthrough",
         "for", "func", "go", "goto", "if", "import", "interface", "map", "package", "range",
         "return", "select", "struct", "switch", "type", "var", "true", "false", "nil"},
        {"bool", "byte", "error", "float32", "float64", "int", "int8", "int16", "int32", "int64",
         "rune", "string", "uint", "uint8", "uint16", "uint32", "uint64", "uintptr"},
        {"//"}, "/*", "*/"));

    out.push_back(make_syntax("Java", {"java", "kt", "kts"},
        {"abstract", "break", "case", "catch", "class", "continue", "default", "do", "else",
         "enum", "extends", "final", "finally", "for", "if", "implements", "import",
         "instanceof", "interface", "new", "package", "private", "protected", "public",
         "return", "static", "super", "switch", "this", "throw", "throws", "try", "while",
         "true", "false", "null", "fun", "val", "var"},
        {"boolean", "byte", "char", "double", "float", "int", "long", "short", "void", "String"},
        {"//"}, "/*", "*/"));

    auto toml_syntax = make_syntax("TOML", {"toml"}, {"true", "false"}, {}, {"#"});
    toml_syntax.file_names = {"Cargo.lock"};
    out.push_back(toml_syntax);

    auto markdown = make_syntax("Markdown", {"md", "markdown"}, {}, {}, {});
    markdown.string_quotes = "`";
    out.push_back(markdown);

    auto cmake = make_syntax("CMake", {"cmake"},
        {"if", "elseif", "else", "endif", "foreach", "endforeach", "while", "endwhile",
         "function", "endfunction", "macro", "endmacro", "set", "option", "project",
         "add_library", "add_executable", "target_link_libraries", "find_package"},
        {}, {"#"});
    cmake.file_names = {"CMakeLists.txt"};
    cmake.string_quotes = "\"";
    out.push_back(cmake);

    auto make = make_syntax("Makefile", {"mk", "mak"},
        {"ifeq", "ifneq", "ifdef", "ifndef", "else", "endif", "include", "define", "endef",
         "export", "override"},
        {}, {"#"});
    make.file_names = {"Makefile", "makefile", "GNUmakefile"};
    out.push_back(make);

    return out;
}

void read_string_array(const toml::node_view<toml::node>& node, std::vector<std::string>& out) {
    if (auto arr = node.as_array()) {
        for (auto& el : *arr) {
            if (auto s = el.value<std::string>()) out.push_back(*s);
        }
    }
}

}

SyntaxSet SyntaxSet::load_defaults() {
    SyntaxSet set;
    for (auto& def : builtin_syntaxes()) {
        Result r = set.add(std::move(def));
        if (r.failure()) {
            std::cerr << "Warning: " << r.message << "\n";
        }
    }
    return set;
}

Result SyntaxSet::add(SyntaxDefinition definition) {
    for (auto& ext : definition.extensions) {
        ext = to_lower(ext);
        if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    }

    Entry entry;
    if (!definition.first_line_match.empty()) {
        try {
            entry.first_line = std::regex(definition.first_line_match, std::regex::ECMAScript);
            entry.has_first_line = true;
        } catch (const std::regex_error& e) {
            return Result::fail(ErrorCode::INVALID_FORMAT,
                                "syntax '" + definition.name + "': invalid first_line_match: " + e.what());
        }
    }
    entry.definition = std::make_shared<const SyntaxDefinition>(std::move(definition));
    entries_.push_back(std::move(entry));
    return Result::ok();
}

Result SyntaxSet::load_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(std::filesystem::path(path), ec) || ec) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "syntax file not found: " + path);
    }

    try {
        auto tbl = toml::parse_file(path);

        SyntaxDefinition def;
        if (auto v = tbl["name"].value<std::string>()) {
            def.name = *v;
        } else {
            def.name = std::filesystem::path(path).stem().string();
        }
        read_string_array(tbl["extensions"], def.extensions);
        read_string_array(tbl["file_names"], def.file_names);
        read_string_array(tbl["line_comments"], def.line_comments);
        if (auto v = tbl["first_line_match"].value<std::string>()) def.first_line_match = *v;

        std::vector<std::string> words;
        read_string_array(tbl["keywords"], words);
        def.keywords.insert(words.begin(), words.end());
        words.clear();
        read_string_array(tbl["types"], words);
        def.types.insert(words.begin(), words.end());

        std::vector<std::string> block;
        read_string_array(tbl["block_comment"], block);
        if (!block.empty()) {
            if (block.size() != 2) {
                return Result::fail(ErrorCode::INVALID_FORMAT, path + ": block_comment needs exactly two entries");
            }
            def.block_comment_start = block[0];
            def.block_comment_end = block[1];
        }

        if (auto v = tbl["string_quotes"].value<std::string>()) def.string_quotes = *v;
        if (auto v = tbl["multiline_strings"].value<bool>()) def.multiline_strings = *v;
        if (auto v = tbl["preprocessor"].value<std::string>()) {
            if (v->size() > 1) {
                return Result::fail(ErrorCode::INVALID_FORMAT, path + ": preprocessor must be a single character");
            }
            def.preprocessor = v->empty() ? '\0' : (*v)[0];
        }

        if (def.extensions.empty() && def.file_names.empty() && def.first_line_match.empty()) {
            return Result::fail(ErrorCode::INVALID_FORMAT, path + ": syntax matches no files");
        }
        return add(std::move(def));
    } catch (const toml::parse_error& e) {
        std::ostringstream ss;
        ss << path << ": " << e.description();
        return Result::fail(ErrorCode::INVALID_FORMAT, ss.str());
    }
}

Result SyntaxSet::load_directory(const std::string& dir) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(fs::path(dir), ec) || ec) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "syntax directory not found: " + dir);
    }

    std::vector<std::string> files;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && it->path().extension() == ".toml") {
            files.push_back(it->path().string());
        }
    }
    if (ec) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "can not list syntax directory " + dir + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        Result r = load_file(file);
        if (r.failure()) return r;
    }
    return Result::ok();
}

Result SyntaxSet::find_syntax_for_file(const std::filesystem::path& path,
                                       std::string_view first_line,
                                       std::shared_ptr<const SyntaxDefinition>& out) const {
    out.reset();
    const std::string file_name = path.filename().string();
    if (file_name.empty() || file_name == "." || file_name == "..") {
        return Result::fail(ErrorCode::SYNTAX_LOOKUP_ERROR,
                            "can not resolve syntax for path without a file name: '" + path.string() + "'");
    }

    for (const auto& entry : entries_) {
        const auto& names = entry.definition->file_names;
        if (std::find(names.begin(), names.end(), file_name) != names.end()) {
            out = entry.definition;
            return Result::ok();
        }
    }

    std::string ext = path.extension().string();
    if (!ext.empty()) {
        ext = to_lower(ext.substr(1));
        for (const auto& entry : entries_) {
            const auto& exts = entry.definition->extensions;
            if (std::find(exts.begin(), exts.end(), ext) != exts.end()) {
                out = entry.definition;
                return Result::ok();
            }
        }
    }

    if (first_line.empty()) {
        return Result::ok();
    }
    for (const auto& entry : entries_) {
        if (!entry.has_first_line) continue;
        try {
            if (std::regex_search(first_line.begin(), first_line.end(), entry.first_line)) {
                out = entry.definition;
                return Result::ok();
            }
        } catch (const std::regex_error& e) {
            return Result::fail(ErrorCode::SYNTAX_LOOKUP_ERROR,
                                "first line match of syntax '" + entry.definition->name +
                                "' failed for " + path.string() + ": " + e.what());
        }
    }
    return Result::ok();
}

std::shared_ptr<const SyntaxDefinition> SyntaxSet::find_syntax_by_name(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.definition->name == name) return entry.definition;
    }
    return nullptr;
}

}
