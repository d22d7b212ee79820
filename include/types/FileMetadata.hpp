#pragma once

#include <ctime>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace bfs::types {

enum class EntryType { File, Directory };

/// Normalized record handed back to the filesystem layer for files and
/// (synthetic) directories alike. Which optional fields are set depends on the
/// operation that produced it.
struct FileMetadata {
    std::string path;
    std::string dirname;
    EntryType type{EntryType::File};
    std::optional<std::time_t> timestamp;

    // Set together when the record was built from blob properties; a missing
    // mimetype then means the service reported none.
    std::optional<uintmax_t> size;
    std::optional<std::string> mimetype;

    std::optional<std::string> contents;

    // Un-drained content stream from readStream(). The caller owns it.
    std::shared_ptr<std::istream> stream;

    [[nodiscard]] bool isDirectory() const { return type == EntryType::Directory; }
    [[nodiscard]] bool isFile() const { return type == EntryType::File; }
    [[nodiscard]] bool hasProperties() const { return size.has_value(); }

    static FileMetadata directory(const std::string& path);

    bool operator==(const FileMetadata&) const = default;
};

std::string to_string(EntryType type);

void to_json(nlohmann::json& j, const FileMetadata& m);

}
