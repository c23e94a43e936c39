#pragma once

#include "core/types.hpp"
#include "render/render.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace codevis {

struct LoadOptions {
    uint64_t max_file_size = 8ull * 1024 * 1024;
    bool include_hidden = false;
};

struct LoadStats {
    std::size_t loaded = 0;
    std::size_t skipped_hidden = 0;
    std::size_t skipped_large = 0;
    std::size_t skipped_binary = 0;
};

// True for text that holds no NUL in its first 8 KiB and is valid UTF-8.
bool looks_like_text(const std::string& content);

// `root` may be a single file or a directory, which is walked recursively.
// Units come back sorted by path.
Result load_sources(const std::string& root, const LoadOptions& options,
                    std::vector<SourceUnit>& out, LoadStats* stats = nullptr);

}
