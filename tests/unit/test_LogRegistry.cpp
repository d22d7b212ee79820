#include <gtest/gtest.h>
#include "logging/LogRegistry.hpp"

using namespace bfs::logging;

TEST(LogRegistryTest, SubsystemLoggersAreRegistered) {
    ASSERT_TRUE(LogRegistry::isInitialized());

    EXPECT_EQ(LogRegistry::blobfs()->name(), "blobfs");
    EXPECT_EQ(LogRegistry::storage()->name(), "storage");
    EXPECT_EQ(LogRegistry::cloud()->name(), "cloud");
    EXPECT_EQ(LogRegistry::config()->name(), "config");
}

TEST(LogRegistryTest, UnknownLoggerThrows) {
    EXPECT_THROW(LogRegistry::get("fuse"), std::runtime_error);
}

TEST(LogRegistryTest, SecondInitKeepsExistingLoggers) {
    const auto before = LogRegistry::storage();
    LogRegistry::init();
    EXPECT_EQ(LogRegistry::storage(), before);
}
