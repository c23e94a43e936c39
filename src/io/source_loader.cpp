#include "io/source_loader.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

namespace codevis {

namespace {

constexpr std::size_t kBinaryProbeBytes = 8192;

bool is_hidden(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    return name.size() > 1 && name[0] == '.' && name != "..";
}

bool valid_utf8(const std::string& s) {
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    const std::size_t n = s.size();
    std::size_t i = 0;
    while (i < n) {
        const unsigned char c = p[i];
        std::size_t len;
        uint32_t cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) return false;
        for (std::size_t k = 1; k < len; ++k) {
            if ((p[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (p[i + k] & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

Result read_file(const std::filesystem::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "Cannot open " + path.string());
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "Failed to read " + path.string());
    }
    return Result::ok();
}

}

bool looks_like_text(const std::string& content) {
    const std::size_t probe = std::min(content.size(), kBinaryProbeBytes);
    if (std::memchr(content.data(), '\0', probe) != nullptr) return false;
    return valid_utf8(content);
}

Result load_sources(const std::string& root, const LoadOptions& options,
                    std::vector<SourceUnit>& out, LoadStats* stats) {
    namespace fs = std::filesystem;
    out.clear();
    LoadStats local;
    LoadStats& s = stats ? *stats : local;
    s = LoadStats{};

    std::error_code ec;
    const fs::path base(root);
    if (root.empty() || !fs::exists(base, ec) || ec) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "Input path does not exist: " + root);
    }

    std::vector<fs::path> files;
    if (fs::is_regular_file(base, ec)) {
        files.push_back(base);
    } else if (fs::is_directory(base, ec)) {
        fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return Result::fail(ErrorCode::FILE_NOT_FOUND, "Cannot read directory " + root + ": " + ec.message());
        }
        for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                return Result::fail(ErrorCode::PROCESSING_ERROR, "Directory walk failed: " + ec.message());
            }
            const fs::directory_entry& entry = *it;
            if (!options.include_hidden && is_hidden(entry.path())) {
                ++s.skipped_hidden;
                if (entry.is_directory(ec)) it.disable_recursion_pending();
                continue;
            }
            if (entry.is_regular_file(ec)) {
                files.push_back(entry.path());
            }
        }
    } else {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Input is neither a file nor a directory: " + root);
    }

    std::sort(files.begin(), files.end());

    for (const auto& path : files) {
        const uintmax_t size = fs::file_size(path, ec);
        if (ec) {
            return Result::fail(ErrorCode::PROCESSING_ERROR, "Cannot stat " + path.string() + ": " + ec.message());
        }
        if (size > options.max_file_size) {
            ++s.skipped_large;
            continue;
        }
        SourceUnit unit;
        unit.path = path;
        Result r = read_file(path, unit.text);
        if (r.failure()) return r;
        if (!looks_like_text(unit.text)) {
            ++s.skipped_binary;
            continue;
        }
        out.push_back(std::move(unit));
        ++s.loaded;
    }
    return Result::ok();
}

}
