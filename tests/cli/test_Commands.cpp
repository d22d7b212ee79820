#include "cli/Commands.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace bfs;

namespace fs = std::filesystem;

class CommandsTest : public ::testing::Test {
protected:
    fs::path root;
    config::Config cfg;
    std::ostringstream out, err;

    void SetUp() override {
        std::random_device rd;
        root = fs::temp_directory_path() / ("blobfs_cli_test_" + std::to_string(rd()));
        fs::create_directories(root);
        cfg.storage.root = root / "store";
        cfg.storage.container = "cli";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    int run(const std::vector<std::string>& args) {
        out.str({});
        err.str({});
        return cli::execute(cfg, args, out, err);
    }

    fs::path localFile(const std::string& name, const std::string& contents) const {
        const auto path = root / name;
        std::ofstream(path, std::ios::binary) << contents;
        return path;
    }
};

TEST_F(CommandsTest, PutThenCat) {
    const auto src = localFile("hello.txt", "hello blobfs");

    ASSERT_EQ(run({"put", "docs/hello.txt", src.string(), "--content-type", "text/plain"}), cli::EXIT_OK);
    const auto record = nlohmann::json::parse(out.str());
    EXPECT_EQ(record.at("path"), "docs/hello.txt");
    EXPECT_EQ(record.at("dirname"), "docs");

    ASSERT_EQ(run({"cat", "docs/hello.txt"}), cli::EXIT_OK);
    EXPECT_EQ(out.str(), "hello blobfs");

    ASSERT_EQ(run({"stat", "docs/hello.txt"}), cli::EXIT_OK);
    EXPECT_EQ(nlohmann::json::parse(out.str()).at("mimetype"), "text/plain");
}

TEST_F(CommandsTest, ExistsExitCodes) {
    const auto src = localFile("a.txt", "a");
    ASSERT_EQ(run({"put", "a.txt", src.string()}), cli::EXIT_OK);

    EXPECT_EQ(run({"exists", "a.txt"}), cli::EXIT_OK);
    EXPECT_EQ(run({"exists", "b.txt"}), cli::EXIT_ERROR);
}

TEST_F(CommandsTest, RecursiveListing) {
    const auto src = localFile("x", "x");
    ASSERT_EQ(run({"put", "top.txt", src.string()}), cli::EXIT_OK);
    ASSERT_EQ(run({"put", "dir/sub/deep.txt", src.string()}), cli::EXIT_OK);

    ASSERT_EQ(run({"ls", "-r"}), cli::EXIT_OK);
    const auto flat = nlohmann::json::parse(out.str());
    ASSERT_EQ(flat.size(), 2u);
    EXPECT_EQ(flat[0].at("path"), "dir");
    EXPECT_EQ(flat[0].at("type"), "dir");
    EXPECT_EQ(flat[1].at("path"), "top.txt");

    cfg.listing.recursion = storage::RecursionPolicy::ExpandTree;
    ASSERT_EQ(run({"ls", "-r"}), cli::EXIT_OK);
    const auto tree = nlohmann::json::parse(out.str());
    ASSERT_EQ(tree.size(), 4u);
    EXPECT_EQ(tree[0].at("path"), "dir");
    EXPECT_EQ(tree[1].at("path"), "dir/sub");
    EXPECT_EQ(tree[2].at("path"), "dir/sub/deep.txt");
    EXPECT_EQ(tree[3].at("path"), "top.txt");
}

TEST_F(CommandsTest, MissingBlobIsServiceError) {
    EXPECT_EQ(run({"cat", "nope.txt"}), cli::EXIT_ERROR);
    EXPECT_NE(err.str().find("404"), std::string::npos);

    EXPECT_EQ(run({"rm", "nope.txt"}), cli::EXIT_ERROR);
    EXPECT_EQ(run({"mv", "nope.txt", "other.txt"}), cli::EXIT_ERROR);
}

TEST_F(CommandsTest, UsageErrors) {
    EXPECT_EQ(run({}), cli::EXIT_USAGE);
    EXPECT_EQ(run({"cat"}), cli::EXIT_USAGE);
    EXPECT_EQ(run({"cp", "only-one"}), cli::EXIT_USAGE);
    EXPECT_EQ(run({"stat", "a", "b"}), cli::EXIT_USAGE);
    EXPECT_EQ(run({"frobnicate"}), cli::EXIT_USAGE);
    EXPECT_EQ(run({"put", "a.txt", (root / "does-not-exist").string()}), cli::EXIT_USAGE);
}

TEST_F(CommandsTest, CopyMoveAndRemove) {
    const auto src = localFile("f", "data");
    ASSERT_EQ(run({"put", "d/f.txt", src.string()}), cli::EXIT_OK);

    EXPECT_EQ(run({"cp", "d/f.txt", "d/g.txt"}), cli::EXIT_OK);
    EXPECT_EQ(run({"mv", "d/g.txt", "e/h.txt"}), cli::EXIT_OK);
    EXPECT_EQ(run({"exists", "d/g.txt"}), cli::EXIT_ERROR);
    EXPECT_EQ(run({"exists", "e/h.txt"}), cli::EXIT_OK);

    EXPECT_EQ(run({"rm", "e/h.txt"}), cli::EXIT_OK);
    EXPECT_EQ(run({"rmdir", "d"}), cli::EXIT_OK);
    EXPECT_EQ(run({"exists", "d/f.txt"}), cli::EXIT_ERROR);
}

TEST_F(CommandsTest, MkdirPrintsSyntheticDirectory) {
    ASSERT_EQ(run({"mkdir", "photos"}), cli::EXIT_OK);
    const auto record = nlohmann::json::parse(out.str());
    EXPECT_EQ(record.at("path"), "photos");
    EXPECT_EQ(record.at("type"), "dir");
}

TEST_F(CommandsTest, ConfigPrintsEffectiveConfiguration) {
    cfg.storage.path_prefix = "tenant";
    ASSERT_EQ(run({"config"}), cli::EXIT_OK);
    const auto j = nlohmann::json::parse(out.str());
    EXPECT_EQ(j.at("storage").at("container"), "cli");
    EXPECT_EQ(j.at("storage").at("path_prefix"), "tenant");
}
