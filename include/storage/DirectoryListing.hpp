#pragma once

#include "storage/blob/BlobClient.hpp"
#include "types/FileMetadata.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace bfs::types {
struct Path;
}

namespace bfs::storage {

/// How listContents() treats its `recursive` argument.
enum class RecursionPolicy {
    FlatPrefix,  // flag is ignored; both modes return the first-level view
    ExpandTree   // recursive=true returns every file plus every intermediate directory
};

struct ListingConfig {
    RecursionPolicy recursion = RecursionPolicy::FlatPrefix;
};

std::string to_string(RecursionPolicy policy);
RecursionPolicy recursionPolicyFromString(const std::string& name);

/// Builds the file record for a blob from its service-reported properties.
types::FileMetadata normalizeBlobProperties(const std::string& path, const blob::BlobProperties& properties);

/// Turns a flat prefix listing into ordered directory contents.
///
/// `directory` is relative to the root prefix. Keys directly under it become
/// file records; deeper keys contribute a synthetic directory entry for their
/// first segment, emitted once at the position it is first seen. With
/// `expandTree`, every file at any depth is emitted instead and each
/// intermediate directory appears once, ahead of the first file beneath it.
/// Common prefixes from the listing are appended last, skipping duplicates.
std::vector<types::FileMetadata> emulateDirectories(const blob::ListBlobsResult& listing,
                                                    const types::Path& root,
                                                    std::string_view directory,
                                                    bool expandTree = false);

}
