#pragma once

#include <string>
#include <string_view>

// Blob keys are plain '/'-separated strings. std::filesystem::path is not used
// here because keys may legally contain segments a local filesystem rejects.
namespace bfs::util {

constexpr char KEY_SEPARATOR = '/';

inline std::string trimLeadingSlashes(std::string_view path) {
    const auto pos = path.find_first_not_of("/\\");
    if (pos == std::string_view::npos) return {};
    return std::string(path.substr(pos));
}

inline std::string stripTrailingSlash(std::string_view path) {
    while (!path.empty() && path.back() == KEY_SEPARATOR) path.remove_suffix(1);
    return std::string(path);
}

inline std::string ensureTrailingSlash(std::string_view path) {
    if (path.empty()) return {};
    std::string out = stripTrailingSlash(path);
    out += KEY_SEPARATOR;
    return out;
}

/// Parent of a key, "" for top-level keys ("bar/foo.txt" -> "bar", "foo.txt" -> "").
inline std::string dirname(std::string_view path) {
    const auto trimmed = stripTrailingSlash(path);
    const auto pos = trimmed.rfind(KEY_SEPARATOR);
    if (pos == std::string::npos) return {};
    return trimmed.substr(0, pos);
}

inline bool startsWith(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

} // namespace bfs::util
