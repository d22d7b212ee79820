#pragma once

#include "storage/blob/BlobClient.hpp"

#include <ctime>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <gmock/gmock.h>

namespace bfs::storage::blob::test {

class MockBlobClient : public BlobClient {
public:
    MOCK_METHOD(CreateBlobResult, createOrReplaceBlob,
                (const std::string& container, const std::string& key, const UploadSource& content,
                 const CreateBlobOptions& options), (override));
    MOCK_METHOD(GetBlobResult, getBlob, (const std::string& container, const std::string& key), (override));
    MOCK_METHOD(BlobLookup, getBlobMetadata, (const std::string& container, const std::string& key), (override));
    MOCK_METHOD(BlobProperties, getBlobProperties, (const std::string& container, const std::string& key), (override));
    MOCK_METHOD(void, deleteBlob, (const std::string& container, const std::string& key), (override));
    MOCK_METHOD(void, copyBlob, (const std::string& container, const std::string& destKey,
                                 const std::string& srcContainer, const std::string& srcKey), (override));
    MOCK_METHOD(ListBlobsResult, listBlobs, (const std::string& container, const ListBlobsOptions& options), (override));
};

inline constexpr const auto* LAST_MODIFIED = "Tue, 02 Dec 2014 08:09:01 +0000";
inline constexpr std::time_t LAST_MODIFIED_EPOCH = 1417507741;

inline BlobProperties makeProperties(const uintmax_t length, std::optional<std::string> contentType = std::nullopt) {
    return {.last_modified = LAST_MODIFIED, .content_type = std::move(contentType), .content_length = length};
}

inline GetBlobResult makeReadResult(const std::string& content) {
    return {.properties = makeProperties(content.size()),
            .content = std::make_shared<std::istringstream>(content)};
}

inline Blob makeBlob(const std::string& name) {
    return {.name = name, .properties = makeProperties(42, "text/plain")};
}

}
