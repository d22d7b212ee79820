#include "storage/DirectoryListing.hpp"
#include "types/Path.hpp"
#include "util/fsPath.hpp"
#include "util/timestamp.hpp"

#include <stdexcept>
#include <unordered_set>

using namespace bfs::storage;
using namespace bfs::types;

std::string bfs::storage::to_string(const RecursionPolicy policy) {
    switch (policy) {
    case RecursionPolicy::FlatPrefix: return "flat_prefix";
    case RecursionPolicy::ExpandTree: return "expand_tree";
    default: throw std::invalid_argument("Invalid RecursionPolicy");
    }
}

RecursionPolicy bfs::storage::recursionPolicyFromString(const std::string& name) {
    if (name == "flat_prefix") return RecursionPolicy::FlatPrefix;
    if (name == "expand_tree") return RecursionPolicy::ExpandTree;
    throw std::invalid_argument("Unknown listing recursion policy: " + name);
}

FileMetadata bfs::storage::normalizeBlobProperties(const std::string& path, const blob::BlobProperties& properties) {
    FileMetadata m;
    m.path = path;
    m.dirname = util::dirname(path);
    m.type = EntryType::File;
    m.timestamp = util::parseHttpDate(properties.last_modified);
    m.mimetype = properties.content_type;
    m.size = properties.content_length;
    return m;
}

std::vector<FileMetadata> bfs::storage::emulateDirectories(const blob::ListBlobsResult& listing,
                                                           const Path& root,
                                                           const std::string_view directory,
                                                           const bool expandTree) {
    const auto dirPrefix = util::ensureTrailingSlash(util::trimLeadingSlashes(directory));

    std::vector<FileMetadata> contents;
    std::unordered_set<std::string> seenDirs;

    const auto emitDir = [&](const std::string& path) {
        if (seenDirs.insert(path).second) contents.push_back(FileMetadata::directory(path));
    };

    for (const auto& blob : listing.blobs) {
        const auto rel = root.remove(blob.name);
        if (!util::startsWith(rel, dirPrefix)) continue;

        const std::string_view remainder = std::string_view(rel).substr(dirPrefix.size());
        if (remainder.empty()) continue;

        const auto sep = remainder.find(util::KEY_SEPARATOR);
        if (sep == std::string_view::npos) {
            contents.push_back(normalizeBlobProperties(rel, blob.properties));
            continue;
        }

        if (!expandTree) {
            emitDir(dirPrefix + std::string(remainder.substr(0, sep)));
            continue;
        }

        for (auto pos = sep; pos != std::string_view::npos; pos = remainder.find(util::KEY_SEPARATOR, pos + 1))
            emitDir(dirPrefix + std::string(remainder.substr(0, pos)));

        // keys ending in '/' are folder markers, not files
        if (remainder.back() != util::KEY_SEPARATOR)
            contents.push_back(normalizeBlobProperties(rel, blob.properties));
    }

    for (const auto& prefix : listing.prefixes) {
        const auto rel = util::stripTrailingSlash(root.remove(prefix.name));
        if (rel.empty() || rel + util::KEY_SEPARATOR == dirPrefix) continue;
        emitDir(rel);
    }

    return contents;
}
