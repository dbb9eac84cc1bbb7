#include <gtest/gtest.h>
#include <filesystem>
#include "test_utils.hpp"
#include "cli/commands/IndexCommand.hpp"

namespace fs = std::filesystem;

using namespace folio;
using namespace folio::test::utils;

class IndexCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        originalCwd = getCwd();
        setCwd(tempDir);
        ctx.config = SiteConfig::defaults();
    }

    void TearDown() override {
        setCwd(originalCwd);
        removeDir(tempDir);
    }

    fs::path tempDir;
    fs::path originalCwd;
    AppContext ctx;
};

// Test: Writes posts.md listing the newest post first
TEST_F(IndexCommandTest, WritesIndex) {
    createFiles(tempDir / "content/posts", {
        {"old.md", post("Old", "2023-05-01")},
        {"new.md", post("New", "2024-05-01")},
    });

    IndexCommand cmd;
    auto result = cmd.execute(ctx, {});
    ASSERT_TRUE(result.has_value()) << result.error().message;

    std::string index = readFile(tempDir / "content/posts.md");
    auto newPos = index.find("[New](posts/new.html)");
    auto oldPos = index.find("[Old](posts/old.html)");
    ASSERT_NE(newPos, std::string::npos);
    ASSERT_NE(oldPos, std::string::npos);
    EXPECT_LT(newPos, oldPos);
}

// Test: Section, file name and title flags
TEST_F(IndexCommandTest, CustomSection) {
    createFile(tempDir / "content/notes", "n.md", post("Note", "2024-01-01"));

    IndexCommand cmd;
    auto result = cmd.execute(ctx, {"--section", "notes", "--file", "notes.md", "--title", "Notes"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    std::string index = readFile(tempDir / "content/notes.md");
    EXPECT_EQ(index.rfind("---\ntitle: Notes\n---\n", 0), 0u);
    EXPECT_NE(index.find("[Note](notes/n.html)"), std::string::npos);
}

// Test: Bad metadata leaves no index behind
TEST_F(IndexCommandTest, BadDate) {
    createFile(tempDir / "content/posts", "x.md", post("X", "last tuesday"));

    IndexCommand cmd;
    auto result = cmd.execute(ctx, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::MetadataError);
    EXPECT_NE(result.error().message.find("x.md"), std::string::npos);
    EXPECT_FALSE(fs::exists(tempDir / "content/posts.md"));
}
