#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>
#include "test_utils.hpp"
#include "cli/commands/RenameCommand.hpp"

namespace fs = std::filesystem;

using namespace batchfs;
using namespace batchfs::test::utils;

class RenameCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
    AppContext ctx;
};

// Test: Defaults give five digit numbers starting at zero
TEST_F(RenameCommandTest, DefaultPaddingAndStart) {
    createFile(tempDir, "only.txt", "x");

    RenameCommand cmd;
    auto result = cmd.execute(ctx, {tempDir.string(), "doc"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(listFileNames(tempDir), (std::vector<std::string>{"doc_00000.txt"}));
}

// Test: --padding and --start are honoured in any position
TEST_F(RenameCommandTest, PaddingAndStart) {
    createFile(tempDir, "only.jpg", "x");

    RenameCommand cmd;
    auto result = cmd.execute(ctx, {"--start", "10", tempDir.string(), "--padding", "3", "img"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(fileHasContent(tempDir / "img_010.jpg", "x"));
}

// Test: Bad arguments are rejected and nothing is renamed
TEST_F(RenameCommandTest, RejectsBadArguments) {
    createFile(tempDir, "keep.txt", "k");

    RenameCommand cmd;
    const std::vector<std::vector<std::string>> cases{
        {},
        {tempDir.string()},
        {tempDir.string(), "img", "more"},
        {tempDir.string(), "img", "--padding"},
        {tempDir.string(), "img", "--padding", "wide"},
        {tempDir.string(), "img", "--start", "-1"},
        {tempDir.string(), "img", "--start", "99999999999999999999999"},
        {tempDir.string(), "img", "--dry-run"},
        {tempDir.string(), "img", "--padding", "256"},
        {tempDir.string(), "img", "--padding", "1000000000000000000"},
        {tempDir.string(), ""},
    };
    for (const auto& args : cases) {
        auto result = cmd.execute(ctx, args);
        ASSERT_FALSE(result.has_value()) << args.size();
        EXPECT_EQ(result.error().code, ErrorCode::InvalidArgs) << result.error().message;
    }
    EXPECT_EQ(listFileNames(tempDir), (std::vector<std::string>{"keep.txt"}));
}

// Test: Missing directory
TEST_F(RenameCommandTest, MissingDirectory) {
    RenameCommand cmd;
    auto result = cmd.execute(ctx, {(tempDir / "gone").string(), "img"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}
