#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

#include "mcp/McpErrors.h"
#include "utils/PathSandbox.h"

namespace fs = std::filesystem;

class PathSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        base = fs::temp_directory_path() / fs::path("toolhost_sandbox_test_" + std::to_string(now));
        fs::create_directories(base);
        base = fs::canonical(base);
        root = base / "sandbox";
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base, ec);
    }

    fs::path base;
    fs::path root;
};

TEST_F(PathSandboxTest, CreatesMissingRoot) {
    fs::path nested = base / "not" / "yet" / "there";
    PathSandbox sandbox(nested.u8string());
    EXPECT_EQ(sandbox.sandboxRoot(), nested);
    EXPECT_TRUE(fs::is_directory(nested));
}

TEST_F(PathSandboxTest, ResolvesRelativePathsAgainstRoot) {
    PathSandbox sandbox(root.u8string());
    EXPECT_EQ(sandbox.validate("a/b.txt"), root / "a" / "b.txt");
    EXPECT_EQ(sandbox.validate("./x/../y.txt"), root / "y.txt");
    EXPECT_EQ(sandbox.validate("."), root);
}

TEST_F(PathSandboxTest, AcceptsAbsolutePathInside) {
    PathSandbox sandbox(root.u8string());
    EXPECT_EQ(sandbox.validate((root / "data.txt").u8string()), root / "data.txt");
}

TEST_F(PathSandboxTest, RejectsParentEscape) {
    PathSandbox sandbox(root.u8string());
    try {
        sandbox.validate("../outside.txt");
        FAIL() << "expected PathValidationError";
    } catch (const PathValidationError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("../outside.txt"), std::string::npos) << msg;
        EXPECT_NE(msg.find("outside sandbox directory"), std::string::npos) << msg;
        EXPECT_NE(msg.find((base / "outside.txt").u8string()), std::string::npos) << msg;
    }
}

TEST_F(PathSandboxTest, RejectsAbsolutePathOutside) {
    PathSandbox sandbox(root.u8string());
    EXPECT_THROW(sandbox.validate("/etc/passwd"), PathValidationError);
    EXPECT_THROW(sandbox.validate(""), PathValidationError);
}

TEST_F(PathSandboxTest, SiblingWithSharedPrefixIsOutside) {
    fs::create_directories(base / "sandbox-evil");
    PathSandbox sandbox(root.u8string());
    EXPECT_THROW(sandbox.validate((base / "sandbox-evil" / "f.txt").u8string()), PathValidationError);
}

TEST_F(PathSandboxTest, RejectsSymlinkPointingOutside) {
    fs::create_directories(base / "secret");
    fs::create_directory_symlink(base / "secret", root / "link");
    PathSandbox sandbox(root.u8string());
    EXPECT_THROW(sandbox.validate("link/key.pem"), PathValidationError);
}

TEST_F(PathSandboxTest, RejectsDanglingSymlinkPointingOutside) {
    fs::create_symlink(base / "does-not-exist.txt", root / "dangling");
    PathSandbox sandbox(root.u8string());
    EXPECT_THROW(sandbox.validate("dangling"), PathValidationError);
}

TEST_F(PathSandboxTest, FollowsSymlinkThatStaysInside) {
    fs::create_directories(root / "real");
    fs::create_directory_symlink(root / "real", root / "alias");
    PathSandbox sandbox(root.u8string());
    EXPECT_EQ(sandbox.validate("alias/f.txt"), root / "real" / "f.txt");
}

TEST_F(PathSandboxTest, ValidateManyFailsOnFirstBadPath) {
    PathSandbox sandbox(root.u8string());
    auto ok = sandbox.validateMany({"a.txt", "b/c.txt"});
    ASSERT_EQ(ok.size(), 2u);
    EXPECT_EQ(ok[1], root / "b" / "c.txt");
    EXPECT_THROW(sandbox.validateMany({"a.txt", "../x"}), PathValidationError);
}

TEST(PathSandboxArguments, ExtractsKnownKeysAndFlattensLists) {
    nlohmann::json args = {
        {"path", "a.txt"},
        {"paths", {"b.txt", "", 3, "c.txt"}},
        {"content", "not a path"},
        {"destination", "d.txt"},
        {"file", ""}
    };
    auto paths = PathSandbox::extractPathArguments(args);
    std::vector<std::string> expected = {"a.txt", "d.txt", "b.txt", "c.txt"};
    EXPECT_EQ(paths, expected);
    EXPECT_TRUE(PathSandbox::extractPathArguments(nlohmann::json::array()).empty());
}

TEST_F(PathSandboxTest, RewritesPathArgumentsInPlace) {
    PathSandbox sandbox(root.u8string());
    nlohmann::json args = {{"source", "in.txt"}, {"destination", "out/in.txt"}, {"paths", {"x", "y"}}, {"mode", "copy"}};
    EXPECT_EQ(sandbox.rewritePathArguments(args), 4u);
    EXPECT_EQ(args["source"], (root / "in.txt").u8string());
    EXPECT_EQ(args["destination"], (root / "out" / "in.txt").u8string());
    EXPECT_EQ(args["paths"][1], (root / "y").u8string());
    EXPECT_EQ(args["mode"], "copy");
}

TEST_F(PathSandboxTest, RejectedRewriteLeavesArgumentsUntouched) {
    PathSandbox sandbox(root.u8string());
    nlohmann::json args = {{"path", "fine.txt"}, {"paths", {"ok.txt", "../../etc/shadow"}}};
    nlohmann::json before = args;
    EXPECT_THROW(sandbox.rewritePathArguments(args), PathValidationError);
    EXPECT_EQ(args, before);
}

TEST(PathSandboxTools, KnowsFilesystemToolNames) {
    EXPECT_TRUE(PathSandbox::isFilesystemTool("read_file"));
    EXPECT_TRUE(PathSandbox::isFilesystemTool("move_file"));
    EXPECT_TRUE(PathSandbox::isFilesystemTool("read_multiple_files"));
    EXPECT_FALSE(PathSandbox::isFilesystemTool("query_database"));
    EXPECT_FALSE(PathSandbox::isFilesystemTool("READ_FILE"));
}
