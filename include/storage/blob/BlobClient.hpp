#pragma once

#include "storage/blob/ServiceError.hpp"

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace bfs::storage::blob {

using MetadataMap = std::unordered_map<std::string, std::string>;

struct BlobProperties {
    std::string last_modified;                  // RFC 1123, as sent in the Last-Modified header
    std::optional<std::string> content_type;
    uintmax_t content_length{0};
};

struct CreateBlobOptions {
    std::optional<std::string> content_type;
    std::optional<std::string> cache_control;
    std::optional<MetadataMap> metadata;
    std::optional<std::string> content_language;
    std::optional<std::string> content_encoding;

    bool operator==(const CreateBlobOptions&) const = default;
};

struct CreateBlobResult {
    std::string last_modified;
};

struct GetBlobResult {
    BlobProperties properties;
    std::shared_ptr<std::istream> content;
};

/// Outcome of a metadata-only existence check.
struct BlobLookup {
    enum class Status { Found, NotFound, Error };

    Status status{Status::Found};
    MetadataMap metadata;
    int code{200};
    std::string message;

    static BlobLookup found(MetadataMap metadata) {
        return {.status = Status::Found, .metadata = std::move(metadata)};
    }

    static BlobLookup notFound() {
        return {.status = Status::NotFound, .code = ServiceError::NOT_FOUND, .message = "BlobNotFound"};
    }

    static BlobLookup error(const int code, std::string message) {
        return {.status = Status::Error, .code = code, .message = std::move(message)};
    }
};

struct Blob {
    std::string name;
    BlobProperties properties;
};

struct BlobPrefix {
    std::string name;                           // virtual folder, with trailing '/'
};

struct ListBlobsOptions {
    std::string prefix;
    std::string marker;                         // continuation token from a previous page

    bool operator==(const ListBlobsOptions&) const = default;
};

struct ListBlobsResult {
    std::vector<Blob> blobs;
    std::vector<BlobPrefix> prefixes;
    std::string next_marker;                    // empty on the last page
};

/// Body of an upload: either an in-memory buffer or a stream read to the end.
using UploadSource = std::variant<std::string, std::shared_ptr<std::istream>>;

/// Capability set of a blob-storage service client. Every call is a single
/// blocking request; retries, timeouts and authentication belong to the
/// implementation. Failures are thrown as ServiceError, except for the
/// existence check, which reports them in its result.
class BlobClient {
public:
    virtual ~BlobClient() = default;

    virtual CreateBlobResult createOrReplaceBlob(const std::string& container, const std::string& key,
                                                 const UploadSource& content,
                                                 const CreateBlobOptions& options) = 0;

    virtual GetBlobResult getBlob(const std::string& container, const std::string& key) = 0;

    virtual BlobLookup getBlobMetadata(const std::string& container, const std::string& key) = 0;

    virtual BlobProperties getBlobProperties(const std::string& container, const std::string& key) = 0;

    virtual void deleteBlob(const std::string& container, const std::string& key) = 0;

    virtual void copyBlob(const std::string& container, const std::string& destKey,
                          const std::string& srcContainer, const std::string& srcKey) = 0;

    virtual ListBlobsResult listBlobs(const std::string& container, const ListBlobsOptions& options) = 0;
};

}
