#pragma once

#include <string>
#include <string_view>

namespace bfs::types {

/// Root namespace prepended to every key the adapter submits to the blob
/// client, and stripped again from every key it hands back.
///
/// The prefix is normalized to end in exactly one '/', so "root", "root/" and
/// "/root//" all address the same namespace. An empty prefix is a no-op.
struct Path {
    explicit Path(std::string_view prefix = {});

    [[nodiscard]] const std::string& prefix() const { return prefix_; }
    [[nodiscard]] bool empty() const { return prefix_.empty(); }

    /// "dir/file.txt" -> "root/dir/file.txt". Leading separators of the
    /// caller's path are dropped first.
    [[nodiscard]] std::string apply(std::string_view path) const;

    /// "root/dir/file.txt" -> "dir/file.txt". Keys outside the namespace are
    /// returned untouched.
    [[nodiscard]] std::string remove(std::string_view key) const;

private:
    std::string prefix_;
};

}
