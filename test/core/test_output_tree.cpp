#include <gtest/gtest.h>

#include <filesystem>

#include "test_utils.hpp"
#include "core/OutputTree.hpp"

namespace fs = std::filesystem;

using namespace folio;
using namespace folio::test::utils;

class OutputTreeTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        originalCwd = getCwd();
        setCwd(tempDir);
        createFiles(tempDir, {
            {"content/index.md", "# Home"},
            {"content/posts/a.md", "a"},
            {"public/index.html", "<html/>"},
            {"public/posts/a.html", "<html/>"},
            {"notes.txt", "keep me"},
        });
    }

    void TearDown() override {
        setCwd(originalCwd);
        removeDir(tempDir);
    }

    fs::path tempDir;
    fs::path originalCwd;
};

// Test: Only the output tree disappears
TEST_F(OutputTreeTest, RemovesOnlyOutput) {
    auto res = removeOutputTree("public", "content");
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_GT(res.value(), 0u);
    EXPECT_FALSE(fs::exists(tempDir / "public"));
    EXPECT_TRUE(fs::exists(tempDir / "content/index.md"));
    EXPECT_TRUE(fs::exists(tempDir / "content/posts/a.md"));
    EXPECT_TRUE(fs::exists(tempDir / "notes.txt"));
}

// Test: Missing output directory is a successful no-op
TEST_F(OutputTreeTest, MissingOutputIsNoop) {
    auto res = removeOutputTree("never-built", "content");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), 0u);
}

// Test: Refuses to delete the content root itself
TEST_F(OutputTreeTest, RefusesContentRoot) {
    auto res = removeOutputTree("content", "content");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ConfigError);
    EXPECT_TRUE(fs::exists(tempDir / "content/index.md"));
}

// Test: Refuses a directory that contains the content root
TEST_F(OutputTreeTest, RefusesAncestorOfContent) {
    createFile(tempDir, "site/content/page.md", "x");
    auto res = removeOutputTree("site", "site/content");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ConfigError);
    EXPECT_TRUE(fs::exists(tempDir / "site/content/page.md"));
}

// Test: Refuses the working directory and the filesystem root
TEST_F(OutputTreeTest, RefusesCwdAndRoot) {
    auto cwd = validateCleanTarget(".", "content");
    ASSERT_FALSE(cwd.has_value());
    EXPECT_EQ(cwd.error().code, ErrorCode::ConfigError);

    auto root = validateCleanTarget("/", "content");
    ASSERT_FALSE(root.has_value());
    EXPECT_EQ(root.error().code, ErrorCode::ConfigError);

    auto empty = validateCleanTarget("", "content");
    EXPECT_FALSE(empty.has_value());
}

// Test: Output nested inside content is fine to remove
TEST_F(OutputTreeTest, AllowsOutputInsideContent) {
    createFile(tempDir, "content/_site/index.html", "<html/>");
    auto res = removeOutputTree("content/_site", "content");
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_FALSE(fs::exists(tempDir / "content/_site"));
    EXPECT_TRUE(fs::exists(tempDir / "content/index.md"));
}

// Test: A regular file in place of the output directory is not removed
TEST_F(OutputTreeTest, RefusesRegularFile) {
    auto res = removeOutputTree("notes.txt", "content");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::ConfigError);
    EXPECT_TRUE(fs::exists(tempDir / "notes.txt"));
}

// Test: A symlinked output directory is not followed
TEST_F(OutputTreeTest, DoesNotFollowSymlinkedOutput) {
    fs::create_directory_symlink(tempDir / "content", tempDir / "linked");
    auto res = removeOutputTree("linked", "elsewhere");
    EXPECT_FALSE(res.has_value());
    EXPECT_TRUE(fs::exists(tempDir / "content/index.md"));
}
