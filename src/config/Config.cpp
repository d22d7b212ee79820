#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace bfs::config {

namespace {

Config fromYaml(const YAML::Node& root) {
    Config cfg;

    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["listing"]) YAML::convert<storage::ListingConfig>::decode(node, cfg.listing);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

spdlog::level::level_enum levelOr(const nlohmann::json& j, const char* key, const spdlog::level::level_enum def) {
    return j.contains(key) ? spdlog::level::from_str(j.at(key).get<std::string>()) : def;
}

}

Config loadConfig(const std::string& path) {
    return fromYaml(YAML::LoadFile(path));
}

Config loadConfigFromString(const std::string& yaml) {
    return fromYaml(YAML::Load(yaml));
}

std::string dumpConfig(const Config& c) {
    YAML::Node root;
    root["storage"] = YAML::convert<StorageConfig>::encode(c.storage);
    root["listing"] = YAML::convert<storage::ListingConfig>::encode(c.listing);
    root["logging"] = YAML::convert<LoggingConfig>::encode(c.logging);

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"storage", c.storage},
        {"listing", c.listing},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("storage")) j.at("storage").get_to(c.storage);
    if (j.contains("listing")) j.at("listing").get_to(c.listing);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"root", c.root.string()},
        {"container", c.container},
        {"path_prefix", c.path_prefix}
    };
}

void from_json(const nlohmann::json& j, StorageConfig& c) {
    c.root = j.value("root", std::string("/var/lib/blobfs"));
    c.container = j.value("container", std::string("default"));
    c.path_prefix = j.value("path_prefix", std::string());
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = c.levels;
    j["log_dir"] = c.log_dir.string();
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", std::string());
    j.get_to(c.levels);
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = levelOr(j, "console_log_level", spdlog::level::info);
    c.file_log_level = levelOr(j, "file_log_level", spdlog::level::warn);
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"blobfs", levelName(c.blobfs)},
        {"storage", levelName(c.storage)},
        {"cloud", levelName(c.cloud)},
        {"config", levelName(c.config)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.blobfs = levelOr(j, "blobfs", spdlog::level::info);
    c.storage = levelOr(j, "storage", spdlog::level::warn);
    c.cloud = levelOr(j, "cloud", spdlog::level::warn);
    c.config = levelOr(j, "config", spdlog::level::warn);
}

}

void bfs::storage::to_json(nlohmann::json& j, const ListingConfig& c) {
    j = {{"recursion", to_string(c.recursion)}};
}

void bfs::storage::from_json(const nlohmann::json& j, ListingConfig& c) {
    c.recursion = recursionPolicyFromString(j.value("recursion", std::string("flat_prefix")));
}
