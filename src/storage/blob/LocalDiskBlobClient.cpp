#include "storage/blob/LocalDiskBlobClient.hpp"
#include "logging/LogRegistry.hpp"
#include "util/fsPath.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>

using namespace bfs::storage::blob;
using namespace bfs::logging;

namespace fs = std::filesystem;

namespace {

constexpr int BAD_REQUEST = 400;
constexpr int CONFLICT = 409;
constexpr int INTERNAL_ERROR = 500;

constexpr const auto* PROPS_SUFFIX = ".props";

void validateContainer(const std::string& container) {
    if (container.empty() || container == "." || container == ".."
        || container.find_first_of("/\\") != std::string::npos
        || container.ends_with(PROPS_SUFFIX))
        throw ServiceError(BAD_REQUEST, "InvalidContainerName: " + container);
}

void validateKey(const std::string& key) {
    if (key.empty() || key.front() == '/' || key.back() == '/')
        throw ServiceError(BAD_REQUEST, "InvalidBlobName: " + key);

    size_t start = 0;
    while (true) {
        const auto end = key.find('/', start);
        const auto seg = key.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (seg.empty() || seg == "." || seg == "..") throw ServiceError(BAD_REQUEST, "InvalidBlobName: " + key);
        if (end == std::string::npos) break;
        start = end + 1;
    }
}

nlohmann::json optionsToJson(const CreateBlobOptions& o) {
    nlohmann::json j = nlohmann::json::object();
    if (o.content_type) j["content_type"] = *o.content_type;
    if (o.cache_control) j["cache_control"] = *o.cache_control;
    if (o.content_language) j["content_language"] = *o.content_language;
    if (o.content_encoding) j["content_encoding"] = *o.content_encoding;
    if (o.metadata) j["metadata"] = *o.metadata;
    return j;
}

nlohmann::json loadJson(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return nlohmann::json::object();
    std::ifstream in(path);
    if (!in) throw ServiceError(INTERNAL_ERROR, "Failed to open blob properties: " + path.string());
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        throw ServiceError(INTERNAL_ERROR, "CorruptBlobProperties: " + path.string() + ": " + e.what());
    }
}

void storeJson(const fs::path& path, const nlohmann::json& j) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw ServiceError(INTERNAL_ERROR, "Failed to open blob properties for writing: " + path.string());
    out << j.dump();
    if (!out) throw ServiceError(INTERNAL_ERROR, "Failed to write blob properties: " + path.string());
}

// One flat file per blob, so no key can reach another key's sidecar.
std::string sidecarName(const std::string& key) {
    std::string out;
    out.reserve(key.size() + 8);
    for (const char c : key) {
        if (c == '%') out += "%25";
        else if (c == '/') out += "%2F";
        else out += c;
    }
    return out + ".json";
}

[[noreturn]] void raiseInternalError(const char* op, const std::string& container, const std::string& key,
                                        const std::exception& e) {
    LogRegistry::cloud()->error("[LocalDiskBlobClient] {} {}/{} failed: {}", op, container, key, e.what());
    throw ServiceError(INTERNAL_ERROR, std::string(op) + " failed for " + container + "/" + key + ": " + e.what());
}

std::string lastModifiedOf(const fs::path& path) {
    std::error_code ec;
    const auto mtime = fs::last_write_time(path, ec);
    if (ec) throw ServiceError(INTERNAL_ERROR, "Failed to stat blob " + path.string() + ": " + ec.message());
    return bfs::util::formatHttpDate(bfs::util::toTimeT(mtime));
}

}

LocalDiskBlobClient::LocalDiskBlobClient(fs::path root, const size_t pageSize)
    : root_(std::move(root)), pageSize_(pageSize) {
    if (root_.empty()) throw std::invalid_argument("[LocalDiskBlobClient] Root directory cannot be empty");
    if (pageSize_ == 0) throw std::invalid_argument("[LocalDiskBlobClient] Page size must be positive");
    fs::create_directories(root_);
}

fs::path LocalDiskBlobClient::containerPath(const std::string& container) const {
    validateContainer(container);
    return root_ / container;
}

fs::path LocalDiskBlobClient::blobPath(const std::string& container, const std::string& key) const {
    validateKey(key);
    return containerPath(container) / fs::path(key);
}

fs::path LocalDiskBlobClient::propsPath(const std::string& container, const std::string& key) const {
    validateKey(key);
    validateContainer(container);
    return root_ / (container + PROPS_SUFFIX) / sidecarName(key);
}

void LocalDiskBlobClient::requireBlob(const std::string& container, const std::string& key) const {
    std::error_code ec;
    if (!fs::is_regular_file(blobPath(container, key), ec)) {
        LogRegistry::cloud()->debug("[LocalDiskBlobClient] Blob not found: {}/{}", container, key);
        throw ServiceError(ServiceError::NOT_FOUND, "BlobNotFound: " + container + "/" + key);
    }
}

void LocalDiskBlobClient::pruneEmptyParents(fs::path dir, const fs::path& stop) const {
    std::error_code ec;
    while (dir != stop && dir.native().starts_with(stop.native())
           && fs::is_directory(dir, ec) && fs::is_empty(dir, ec)) {
        fs::remove(dir, ec);
        if (ec) break;
        dir = dir.parent_path();
    }
}

CreateBlobResult LocalDiskBlobClient::createOrReplaceBlob(const std::string& container, const std::string& key,
                                                          const UploadSource& content,
                                                          const CreateBlobOptions& options) {
    const auto path = blobPath(container, key);
    const auto props = propsPath(container, key);

    if (const auto* in = std::get_if<std::shared_ptr<std::istream>>(&content); in && !*in)
        throw ServiceError(BAD_REQUEST, "Missing upload stream for " + key);

    try {
        if (fs::is_directory(path))
            throw ServiceError(CONFLICT, "BlobPathConflict: " + key + " is a prefix of existing blobs");
        fs::create_directories(path.parent_path());
    } catch (const fs::filesystem_error& e) {
        LogRegistry::cloud()->warn("[LocalDiskBlobClient] Failed to create {}/{}: {}", container, key, e.what());
        throw ServiceError(CONFLICT, std::string("BlobPathConflict: ") + e.what());
    }

    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) throw ServiceError(INTERNAL_ERROR, "Failed to open blob for writing: " + key);

        if (const auto* bytes = std::get_if<std::string>(&content))
            out.write(bytes->data(), static_cast<std::streamsize>(bytes->size()));
        else {
            const auto& in = std::get<std::shared_ptr<std::istream>>(content);
            std::copy(std::istreambuf_iterator<char>(*in), std::istreambuf_iterator<char>(),
                      std::ostreambuf_iterator<char>(out));
        }

        if (!out) {
            out.close();
            discardBlob(path, container);
            throw ServiceError(INTERNAL_ERROR, "Failed to write blob: " + key);
        }
    }

    // a failed upload leaves no blob behind
    try {
        storeJson(props, optionsToJson(options));
    } catch (const ServiceError& e) {
        LogRegistry::cloud()->error("[LocalDiskBlobClient] Discarding {}/{}: {}", container, key, e.what());
        discardBlob(path, container);
        throw;
    } catch (const fs::filesystem_error& e) {
        LogRegistry::cloud()->error("[LocalDiskBlobClient] Discarding {}/{}: {}", container, key, e.what());
        discardBlob(path, container);
        throw ServiceError(INTERNAL_ERROR, std::string("Failed to write blob properties: ") + e.what());
    }

    LogRegistry::cloud()->debug("[LocalDiskBlobClient] Stored {}/{}", container, key);
    return {.last_modified = lastModifiedOf(path)};
}

void LocalDiskBlobClient::discardBlob(const fs::path& path, const std::string& container) const {
    std::error_code ec;
    fs::remove(path, ec);
    pruneEmptyParents(path.parent_path(), containerPath(container));
}

BlobProperties LocalDiskBlobClient::readProperties(const std::string& container, const std::string& key) const {
    requireBlob(container, key);
    const auto path = blobPath(container, key);
    const auto props = loadJson(propsPath(container, key));

    try {
        BlobProperties p;
        p.last_modified = lastModifiedOf(path);
        p.content_length = fs::file_size(path);
        if (props.contains("content_type")) p.content_type = props.at("content_type").get<std::string>();
        return p;
    } catch (const fs::filesystem_error& e) {
        raiseInternalError("Reading properties of", container, key, e);
    } catch (const nlohmann::json::exception& e) {
        raiseInternalError("Reading properties of", container, key, e);
    }
}

MetadataMap LocalDiskBlobClient::readMetadata(const std::string& container, const std::string& key) const {
    const auto props = loadJson(propsPath(container, key));
    if (!props.contains("metadata")) return {};

    try {
        return props.at("metadata").get<MetadataMap>();
    } catch (const nlohmann::json::exception& e) {
        raiseInternalError("Reading metadata of", container, key, e);
    }
}

GetBlobResult LocalDiskBlobClient::getBlob(const std::string& container, const std::string& key) {
    auto properties = readProperties(container, key);

    auto stream = std::make_shared<std::ifstream>(blobPath(container, key), std::ios::binary);
    if (!*stream) throw ServiceError(INTERNAL_ERROR, "Failed to open blob for reading: " + key);

    return {.properties = std::move(properties), .content = std::move(stream)};
}

BlobLookup LocalDiskBlobClient::getBlobMetadata(const std::string& container, const std::string& key) {
    try {
        if (!fs::is_regular_file(blobPath(container, key))) return BlobLookup::notFound();
        return BlobLookup::found(readMetadata(container, key));
    } catch (const ServiceError& e) {
        return BlobLookup::error(e.code(), e.what());
    } catch (const std::exception& e) {
        LogRegistry::cloud()->error("[LocalDiskBlobClient] Metadata lookup for {}/{} failed: {}", container, key, e.what());
        return BlobLookup::error(INTERNAL_ERROR, e.what());
    }
}

BlobProperties LocalDiskBlobClient::getBlobProperties(const std::string& container, const std::string& key) {
    return readProperties(container, key);
}

void LocalDiskBlobClient::deleteBlob(const std::string& container, const std::string& key) {
    requireBlob(container, key);

    const auto path = blobPath(container, key);
    const auto props = propsPath(container, key);

    try {
        fs::remove(path);
        fs::remove(props);
    } catch (const fs::filesystem_error& e) {
        raiseInternalError("Deleting", container, key, e);
    }

    pruneEmptyParents(path.parent_path(), containerPath(container));

    LogRegistry::cloud()->debug("[LocalDiskBlobClient] Deleted {}/{}", container, key);
}

void LocalDiskBlobClient::copyBlob(const std::string& container, const std::string& destKey,
                                   const std::string& srcContainer, const std::string& srcKey) {
    requireBlob(srcContainer, srcKey);

    const auto src = blobPath(srcContainer, srcKey);
    const auto dst = blobPath(container, destKey);
    if (src == dst) return;

    const auto srcProps = propsPath(srcContainer, srcKey);
    const auto dstProps = propsPath(container, destKey);

    try {
        if (fs::is_directory(dst))
            throw ServiceError(CONFLICT, "BlobPathConflict: " + destKey + " is a prefix of existing blobs");

        fs::create_directories(dst.parent_path());
        fs::copy_file(src, dst, fs::copy_options::overwrite_existing);

        fs::create_directories(dstProps.parent_path());
        if (fs::exists(srcProps)) fs::copy_file(srcProps, dstProps, fs::copy_options::overwrite_existing);
        else fs::remove(dstProps);
    } catch (const fs::filesystem_error& e) {
        LogRegistry::cloud()->warn("[LocalDiskBlobClient] Failed to copy {}/{} to {}/{}: {}",
                                   srcContainer, srcKey, container, destKey, e.what());
        throw ServiceError(CONFLICT, std::string("BlobPathConflict: ") + e.what());
    }

    LogRegistry::cloud()->debug("[LocalDiskBlobClient] Copied {}/{} to {}/{}", srcContainer, srcKey, container, destKey);
}

ListBlobsResult LocalDiskBlobClient::listBlobs(const std::string& container, const ListBlobsOptions& options) {
    ListBlobsResult result;

    const auto dir = containerPath(container);
    if (!fs::is_directory(dir)) return result;

    std::vector<std::string> keys;
    try {
        for (const auto& entry : fs::recursive_directory_iterator(dir)) {
            if (!entry.is_regular_file()) continue;
            auto key = entry.path().lexically_relative(dir).generic_string();
            if (!bfs::util::startsWith(key, options.prefix)) continue;
            if (!options.marker.empty() && key <= options.marker) continue;
            keys.push_back(std::move(key));
        }
    } catch (const fs::filesystem_error& e) {
        raiseInternalError("Listing", container, options.prefix, e);
    }

    std::ranges::sort(keys);

    for (const auto& key : keys) {
        if (result.blobs.size() == pageSize_) {
            result.next_marker = result.blobs.back().name;
            break;
        }
        result.blobs.push_back({.name = key, .properties = readProperties(container, key)});
    }

    return result;
}
