#pragma once

#include "storage/DirectoryListing.hpp"

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace bfs::config {

struct StorageConfig {
    std::filesystem::path root = "/var/lib/blobfs";
    std::string container = "default";
    std::string path_prefix;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum blobfs  = spdlog::level::info;   // CLI and process-level events
    spdlog::level::level_enum storage = spdlog::level::warn;   // Adapter operations, partial failures
    spdlog::level::level_enum cloud   = spdlog::level::warn;   // Blob client requests and service errors
    spdlog::level::level_enum config  = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir; // empty: console only
    LogLevelsConfig levels;
};

struct Config {
    StorageConfig storage;
    bfs::storage::ListingConfig listing;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);
Config loadConfigFromString(const std::string& yaml);
std::string dumpConfig(const Config& c);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void from_json(const nlohmann::json& j, StorageConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);

}

namespace bfs::storage {
void to_json(nlohmann::json& j, const ListingConfig& c);
void from_json(const nlohmann::json& j, ListingConfig& c);
}
