#include "storage/BlobStorageAdapter.hpp"
#include "logging/LogRegistry.hpp"
#include "util/fsPath.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

using namespace bfs::storage;
using namespace bfs::types;
using namespace bfs::logging;

BlobStorageAdapter::BlobStorageAdapter(std::shared_ptr<blob::BlobClient> client,
                                       std::string container,
                                       const std::string_view prefix,
                                       const ListingConfig listing)
    : client_(std::move(client)),
      container_(std::move(container)),
      root_(prefix),
      listing_(listing) {
    if (!client_) throw std::invalid_argument("[BlobStorageAdapter] Blob client cannot be null");
    if (container_.empty()) throw std::invalid_argument("[BlobStorageAdapter] Container name cannot be empty");

    LogRegistry::storage()->debug("[BlobStorageAdapter] Initialized for container '{}' with prefix '{}' ({})",
                                  container_, root_.prefix(), to_string(listing_.recursion));
}

blob::CreateBlobOptions bfs::storage::toCreateBlobOptions(const WriteOptions& options) {
    return {
        .content_type = options.content_type,
        .cache_control = options.cache_control,
        .metadata = options.metadata,
        .content_language = options.content_language,
        .content_encoding = options.content_encoding
    };
}

FileMetadata BlobStorageAdapter::upload(const std::string& path, const blob::UploadSource& contents,
                                        const WriteOptions& options) const {
    const auto key = root_.apply(path);

    LogRegistry::storage()->debug("[BlobStorageAdapter] Uploading {}", key);
    const auto result = client_->createOrReplaceBlob(container_, key, contents, toCreateBlobOptions(options));

    FileMetadata m;
    m.path = root_.remove(key);
    m.dirname = util::dirname(m.path);
    m.type = EntryType::File;
    m.timestamp = util::parseHttpDate(result.last_modified);
    if (const auto* bytes = std::get_if<std::string>(&contents)) m.contents = *bytes;
    return m;
}

FileMetadata BlobStorageAdapter::write(const std::string& path, const std::string& contents,
                                       const WriteOptions& options) const {
    return upload(path, contents, options);
}

FileMetadata BlobStorageAdapter::writeStream(const std::string& path, const std::shared_ptr<std::istream>& stream,
                                             const WriteOptions& options) const {
    if (!stream) throw std::invalid_argument("[BlobStorageAdapter] Upload stream cannot be null: " + path);
    return upload(path, stream, options);
}

FileMetadata BlobStorageAdapter::update(const std::string& path, const std::string& contents,
                                        const WriteOptions& options) const {
    return upload(path, contents, options);
}

FileMetadata BlobStorageAdapter::updateStream(const std::string& path, const std::shared_ptr<std::istream>& stream,
                                              const WriteOptions& options) const {
    return writeStream(path, stream, options);
}

FileMetadata BlobStorageAdapter::read(const std::string& path) const {
    const auto key = root_.apply(path);
    const auto result = client_->getBlob(container_, key);
    if (!result.content)
        throw std::runtime_error("[BlobStorageAdapter] Blob client returned no content stream for " + key);

    auto m = normalizeBlobProperties(root_.remove(key), result.properties);
    m.contents = std::string(std::istreambuf_iterator<char>(*result.content), std::istreambuf_iterator<char>());
    return m;
}

FileMetadata BlobStorageAdapter::readStream(const std::string& path) const {
    const auto key = root_.apply(path);
    const auto result = client_->getBlob(container_, key);
    if (!result.content)
        throw std::runtime_error("[BlobStorageAdapter] Blob client returned no content stream for " + key);

    auto m = normalizeBlobProperties(root_.remove(key), result.properties);
    m.stream = result.content;
    return m;
}

bool BlobStorageAdapter::has(const std::string& path) const {
    const auto key = root_.apply(path);
    const auto lookup = client_->getBlobMetadata(container_, key);

    switch (lookup.status) {
    case blob::BlobLookup::Status::Found: return true;
    case blob::BlobLookup::Status::NotFound: return false;
    case blob::BlobLookup::Status::Error:
    default:
        LogRegistry::storage()->debug("[BlobStorageAdapter] Existence check for {} failed: HTTP {} {}",
                                      key, lookup.code, lookup.message);
        throw blob::ServiceError(lookup.code, lookup.message);
    }
}

bool BlobStorageAdapter::deleteFile(const std::string& path) const {
    client_->deleteBlob(container_, root_.apply(path));
    return true;
}

std::string BlobStorageAdapter::directoryKey(const std::string_view dirname) const {
    return root_.apply(util::ensureTrailingSlash(util::trimLeadingSlashes(dirname)));
}

bool BlobStorageAdapter::deleteDir(const std::string& dirname) const {
    const auto listing = listAll(directoryKey(dirname));

    size_t deleted = 0;
    for (const auto& item : listing.blobs) {
        try {
            client_->deleteBlob(container_, item.name);
            ++deleted;
        } catch (const blob::ServiceError& e) {
            LogRegistry::storage()->warn("[BlobStorageAdapter] deleteDir({}) aborted after {} of {} blobs at {}: {}",
                                         dirname, deleted, listing.blobs.size(), item.name, e.what());
            throw;
        }
    }

    LogRegistry::storage()->debug("[BlobStorageAdapter] deleteDir({}) removed {} blobs", dirname, deleted);
    return true;
}

FileMetadata BlobStorageAdapter::createDir(const std::string& dirname, const WriteOptions&) const {
    return FileMetadata::directory(dirname);
}

bool BlobStorageAdapter::copy(const std::string& path, const std::string& newpath) const {
    client_->copyBlob(container_, root_.apply(newpath), container_, root_.apply(path));
    return true;
}

bool BlobStorageAdapter::rename(const std::string& path, const std::string& newpath) const {
    copy(path, newpath);

    try {
        return deleteFile(path);
    } catch (const blob::ServiceError& e) {
        LogRegistry::storage()->warn("[BlobStorageAdapter] rename({} -> {}) copied but could not delete source: {}",
                                     path, newpath, e.what());
        throw;
    }
}

blob::ListBlobsResult BlobStorageAdapter::listAll(const std::string& prefix) const {
    blob::ListBlobsOptions options{.prefix = prefix};
    blob::ListBlobsResult all;

    do {
        auto page = client_->listBlobs(container_, options);
        std::ranges::move(page.blobs, std::back_inserter(all.blobs));
        std::ranges::move(page.prefixes, std::back_inserter(all.prefixes));
        options.marker = std::move(page.next_marker);
    } while (!options.marker.empty());

    return all;
}

std::vector<FileMetadata> BlobStorageAdapter::listContents(const std::string& directory, const bool recursive) const {
    const auto listing = listAll(directoryKey(directory));
    const bool expand = recursive && listing_.recursion == RecursionPolicy::ExpandTree;
    return emulateDirectories(listing, root_, directory, expand);
}

FileMetadata BlobStorageAdapter::getMetadata(const std::string& path) const {
    const auto key = root_.apply(path);
    return normalizeBlobProperties(root_.remove(key), client_->getBlobProperties(container_, key));
}

FileMetadata BlobStorageAdapter::getSize(const std::string& path) const { return getMetadata(path); }

FileMetadata BlobStorageAdapter::getMimetype(const std::string& path) const { return getMetadata(path); }

FileMetadata BlobStorageAdapter::getTimestamp(const std::string& path) const { return getMetadata(path); }

FileMetadata BlobStorageAdapter::getVisibility(const std::string& path) const {
    throw std::logic_error("[BlobStorageAdapter] Blob storage does not support visibility. Path: " + path);
}

FileMetadata BlobStorageAdapter::setVisibility(const std::string& path, Visibility) const {
    throw std::logic_error("[BlobStorageAdapter] Blob storage does not support visibility. Path: " + path);
}
