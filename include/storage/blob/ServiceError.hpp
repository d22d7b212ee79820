#pragma once

#include <stdexcept>
#include <string>

namespace bfs::storage::blob {

/// Failure reported by a blob-storage service, carrying its HTTP-style status
/// code. Client implementations throw this; the adapter lets it pass through.
class ServiceError : public std::runtime_error {
public:
    ServiceError(const int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] int code() const noexcept { return code_; }
    [[nodiscard]] bool isNotFound() const noexcept { return code_ == NOT_FOUND; }

    static constexpr int NOT_FOUND = 404;

private:
    int code_;
};

}
