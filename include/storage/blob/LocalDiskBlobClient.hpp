#pragma once

#include "storage/blob/BlobClient.hpp"

#include <filesystem>
#include <string>

namespace bfs::storage::blob {

/// Blob store emulator on a local directory.
///
/// Container `c` is the directory `root/c`, blob `k` the file `root/c/k`.
/// Per-blob properties that a filesystem cannot hold (content type, cache
/// control, language, encoding, user metadata) are kept in a JSON sidecar at
/// `root/c.props/<k with '%' and '/' percent-encoded>.json`, one flat file per
/// blob. Last-Modified is the blob file's mtime.
///
/// Listings are lexicographic and paged by `pageSize`; the continuation marker
/// is the last key of the previous page.
class LocalDiskBlobClient final : public BlobClient {
public:
    static constexpr size_t DEFAULT_PAGE_SIZE = 5000;

    explicit LocalDiskBlobClient(std::filesystem::path root, size_t pageSize = DEFAULT_PAGE_SIZE);
    ~LocalDiskBlobClient() override = default;

    CreateBlobResult createOrReplaceBlob(const std::string& container, const std::string& key,
                                         const UploadSource& content, const CreateBlobOptions& options) override;

    GetBlobResult getBlob(const std::string& container, const std::string& key) override;

    BlobLookup getBlobMetadata(const std::string& container, const std::string& key) override;

    BlobProperties getBlobProperties(const std::string& container, const std::string& key) override;

    void deleteBlob(const std::string& container, const std::string& key) override;

    void copyBlob(const std::string& container, const std::string& destKey,
                  const std::string& srcContainer, const std::string& srcKey) override;

    ListBlobsResult listBlobs(const std::string& container, const ListBlobsOptions& options) override;

private:
    std::filesystem::path root_;
    size_t pageSize_;

    [[nodiscard]] std::filesystem::path containerPath(const std::string& container) const;
    [[nodiscard]] std::filesystem::path blobPath(const std::string& container, const std::string& key) const;
    [[nodiscard]] std::filesystem::path propsPath(const std::string& container, const std::string& key) const;

    [[nodiscard]] BlobProperties readProperties(const std::string& container, const std::string& key) const;
    [[nodiscard]] MetadataMap readMetadata(const std::string& container, const std::string& key) const;

    void requireBlob(const std::string& container, const std::string& key) const;
    void pruneEmptyParents(std::filesystem::path dir, const std::filesystem::path& stop) const;
    void discardBlob(const std::filesystem::path& path, const std::string& container) const;
};

}
