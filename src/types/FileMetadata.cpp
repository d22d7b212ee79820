#include "types/FileMetadata.hpp"
#include "util/fsPath.hpp"

#include <nlohmann/json.hpp>

using namespace bfs::types;

FileMetadata FileMetadata::directory(const std::string& path) {
    FileMetadata m;
    m.path = path;
    m.dirname = util::dirname(path);
    m.type = EntryType::Directory;
    return m;
}

std::string bfs::types::to_string(const EntryType type) {
    return type == EntryType::Directory ? "dir" : "file";
}

void bfs::types::to_json(nlohmann::json& j, const FileMetadata& m) {
    j = {
        {"path", m.path},
        {"dirname", m.dirname},
        {"type", to_string(m.type)}
    };

    if (m.timestamp) j["timestamp"] = *m.timestamp;

    if (m.hasProperties()) {
        j["size"] = *m.size;
        j["mimetype"] = m.mimetype ? nlohmann::json(*m.mimetype) : nlohmann::json(nullptr);
    }

    if (m.contents) j["contents"] = *m.contents;
}
