#pragma once

#include "storage/DirectoryListing.hpp"
#include "storage/blob/BlobClient.hpp"
#include "types/FileMetadata.hpp"
#include "types/Path.hpp"
#include "types/WriteOptions.hpp"

#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bfs::storage {

/// Presents a flat blob container as a hierarchical filesystem.
///
/// Every public path is relative to the configured root prefix; keys sent to
/// the client carry the prefix and records handed back have it stripped.
/// Directories are never stored: createDir() is bookkeeping only and
/// listContents() derives directory entries from key prefixes.
///
/// Each operation issues its client calls sequentially and lets any
/// blob::ServiceError propagate unchanged. has() is the only place a missing
/// blob is turned into a value.
class BlobStorageAdapter {
public:
    BlobStorageAdapter(std::shared_ptr<blob::BlobClient> client,
                       std::string container,
                       std::string_view prefix = {},
                       ListingConfig listing = {});

    [[nodiscard]] const std::shared_ptr<blob::BlobClient>& client() const { return client_; }
    [[nodiscard]] const std::string& container() const { return container_; }
    [[nodiscard]] const std::string& pathPrefix() const { return root_.prefix(); }

    [[nodiscard]] std::string applyPathPrefix(std::string_view path) const { return root_.apply(path); }
    [[nodiscard]] std::string removePathPrefix(std::string_view key) const { return root_.remove(key); }

    // Blob creation always overwrites, so write and update are the same call.
    types::FileMetadata write(const std::string& path, const std::string& contents,
                              const types::WriteOptions& options = {}) const;
    types::FileMetadata writeStream(const std::string& path, const std::shared_ptr<std::istream>& stream,
                                    const types::WriteOptions& options = {}) const;
    types::FileMetadata update(const std::string& path, const std::string& contents,
                               const types::WriteOptions& options = {}) const;
    types::FileMetadata updateStream(const std::string& path, const std::shared_ptr<std::istream>& stream,
                                     const types::WriteOptions& options = {}) const;

    [[nodiscard]] types::FileMetadata read(const std::string& path) const;

    /// The returned record's stream is positioned at the start of the blob
    /// and left open for the caller.
    [[nodiscard]] types::FileMetadata readStream(const std::string& path) const;

    [[nodiscard]] bool has(const std::string& path) const;

    bool deleteFile(const std::string& path) const;

    /// Deletes every blob under `dirname`, one request per blob. Not atomic.
    bool deleteDir(const std::string& dirname) const;

    types::FileMetadata createDir(const std::string& dirname, const types::WriteOptions& options = {}) const;

    bool copy(const std::string& path, const std::string& newpath) const;

    /// Copy followed by delete of the source. If the delete fails the copy
    /// is left in place.
    bool rename(const std::string& path, const std::string& newpath) const;

    [[nodiscard]] std::vector<types::FileMetadata> listContents(const std::string& directory = "",
                                                                bool recursive = false) const;

    [[nodiscard]] types::FileMetadata getMetadata(const std::string& path) const;
    [[nodiscard]] types::FileMetadata getSize(const std::string& path) const;
    [[nodiscard]] types::FileMetadata getMimetype(const std::string& path) const;
    [[nodiscard]] types::FileMetadata getTimestamp(const std::string& path) const;

    // Blob containers have no per-object visibility; both throw std::logic_error.
    [[nodiscard]] types::FileMetadata getVisibility(const std::string& path) const;
    types::FileMetadata setVisibility(const std::string& path, types::Visibility visibility) const;

private:
    std::shared_ptr<blob::BlobClient> client_;
    std::string container_;
    types::Path root_;
    ListingConfig listing_;

    types::FileMetadata upload(const std::string& path, const blob::UploadSource& contents,
                               const types::WriteOptions& options) const;

    [[nodiscard]] blob::ListBlobsResult listAll(const std::string& prefix) const;

    [[nodiscard]] std::string directoryKey(std::string_view dirname) const;
};

blob::CreateBlobOptions toCreateBlobOptions(const types::WriteOptions& options);

}
