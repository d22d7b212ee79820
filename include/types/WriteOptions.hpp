#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace bfs::types {

// Per-write settings forwarded verbatim to the blob client. Unset fields are
// not sent at all.
struct WriteOptions {
    std::optional<std::string> content_type;
    std::optional<std::string> cache_control;
    std::optional<std::unordered_map<std::string, std::string>> metadata;
    std::optional<std::string> content_language;
    std::optional<std::string> content_encoding;
};

enum class Visibility { Public, Private };

}
