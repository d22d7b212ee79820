#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace bfs::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["root"] = rhs.root.string();
        node["container"] = rhs.container;
        node["path_prefix"] = rhs.path_prefix;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>("/var/lib/blobfs");
        rhs.container = node["container"].as<std::string>("default");
        rhs.path_prefix = node["path_prefix"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<bfs::storage::ListingConfig> {
    static Node encode(const bfs::storage::ListingConfig& rhs) {
        Node node;
        node["recursion"] = bfs::storage::to_string(rhs.recursion);
        return node;
    }

    static bool decode(const Node& node, bfs::storage::ListingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.recursion = bfs::storage::recursionPolicyFromString(node["recursion"].as<std::string>("flat_prefix"));
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["blobfs"]  = to_std_string(spdlog::level::to_string_view(rhs.blobfs));
        node["storage"] = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["cloud"]   = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["config"]  = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.blobfs = spdlog::level::from_str(node["blobfs"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node = convert<LogLevelsConfig>::encode(rhs.levels);
        node["log_dir"] = rhs.log_dir.string();
        return node;
    }

    // levels sit directly under the logging section
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        return convert<LogLevelsConfig>::decode(node, rhs.levels);
    }
};

}
