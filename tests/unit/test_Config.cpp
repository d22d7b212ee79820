#include <gtest/gtest.h>
#include "config/Config.hpp"

#include <nlohmann/json.hpp>

using namespace bfs::config;
using bfs::storage::RecursionPolicy;

TEST(ConfigTest, EmptyDocumentYieldsDefaults) {
    const auto cfg = loadConfigFromString("{}");
    EXPECT_EQ(cfg.storage.root.string(), "/var/lib/blobfs");
    EXPECT_EQ(cfg.storage.container, "default");
    EXPECT_TRUE(cfg.storage.path_prefix.empty());
    EXPECT_EQ(cfg.listing.recursion, RecursionPolicy::FlatPrefix);
    EXPECT_TRUE(cfg.logging.log_dir.empty());
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::info);
}

TEST(ConfigTest, LoadsAllSections) {
    const auto cfg = loadConfigFromString(R"(
storage:
  root: /srv/blobs
  container: media
  path_prefix: tenants/acme
listing:
  recursion: expand_tree
logging:
  log_dir: /var/log/blobfs
  console_log_level: debug
  subsystem_levels:
    cloud: trace
)");

    EXPECT_EQ(cfg.storage.root.string(), "/srv/blobs");
    EXPECT_EQ(cfg.storage.container, "media");
    EXPECT_EQ(cfg.storage.path_prefix, "tenants/acme");
    EXPECT_EQ(cfg.listing.recursion, RecursionPolicy::ExpandTree);
    EXPECT_EQ(cfg.logging.log_dir.string(), "/var/log/blobfs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.cloud, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.storage, spdlog::level::warn);
}

TEST(ConfigTest, UnknownRecursionPolicyThrows) {
    EXPECT_THROW(loadConfigFromString("listing:\n  recursion: sideways\n"), std::invalid_argument);
}

TEST(ConfigTest, DumpedYamlLoadsBack) {
    auto cfg = loadConfigFromString("storage:\n  container: photos\n");
    cfg.listing.recursion = RecursionPolicy::ExpandTree;
    cfg.logging.levels.subsystem_levels.storage = spdlog::level::debug;

    const auto reloaded = loadConfigFromString(dumpConfig(cfg));
    EXPECT_EQ(reloaded.storage.container, "photos");
    EXPECT_EQ(reloaded.listing.recursion, RecursionPolicy::ExpandTree);
    EXPECT_EQ(reloaded.logging.levels.subsystem_levels.storage, spdlog::level::debug);
}

TEST(ConfigTest, JsonView) {
    Config cfg;
    cfg.storage.path_prefix = "root";
    const nlohmann::json j = cfg;

    EXPECT_EQ(j.at("storage").at("path_prefix"), "root");
    EXPECT_EQ(j.at("listing").at("recursion"), "flat_prefix");
    EXPECT_EQ(j.at("logging").at("subsystem_levels").at("cloud"), "warning");

    const auto back = j.get<Config>();
    EXPECT_EQ(back.storage.path_prefix, "root");
    EXPECT_EQ(back.logging.levels.subsystem_levels.cloud, spdlog::level::warn);
}
