#include "types/Path.hpp"
#include "util/fsPath.hpp"

using namespace bfs::types;
using namespace bfs::util;

Path::Path(const std::string_view prefix)
    : prefix_(ensureTrailingSlash(trimLeadingSlashes(prefix))) {}

std::string Path::apply(const std::string_view path) const {
    return prefix_ + trimLeadingSlashes(path);
}

std::string Path::remove(const std::string_view key) const {
    if (prefix_.empty() || !startsWith(key, prefix_)) return std::string(key);
    return std::string(key.substr(prefix_.size()));
}
