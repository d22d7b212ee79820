#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace bfs::config {

class ConfigRegistry {
public:
    static constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/blobfs/config.yaml";

    // Loads the file if it exists, otherwise keeps the built-in defaults.
    static void init(const std::filesystem::path& path = DEFAULT_CONFIG_PATH);
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace bfs::config
