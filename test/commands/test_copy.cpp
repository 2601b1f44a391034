#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>
#include "test_utils.hpp"
#include "cli/commands/CopyCommand.hpp"

namespace fs = std::filesystem;

using namespace batchfs;
using namespace batchfs::test::utils;

class CopyCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        src = tempDir / "src";
        dest = tempDir / "dest";
        fs::create_directories(src);
        fs::create_directories(dest);
        createFiles(src, {
            {"a.jpg", "a"},
            {"deep/b.JPG", "b"},
            {"deep/c.png", "c"},
        });
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
    fs::path src;
    fs::path dest;
    AppContext ctx;
};

// Test: Copy everything when no filter is given
TEST_F(CopyCommandTest, CopiesAllFiles) {
    CopyCommand cmd;
    auto result = cmd.execute(ctx, {src.string(), dest.string()});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(listFileNames(dest), (std::vector<std::string>{"a.jpg", "b.JPG", "c.png"}));
}

// Test: --ext accepts a value with or without the leading dot
TEST_F(CopyCommandTest, ExtensionFilterWithDot) {
    CopyCommand cmd;
    auto result = cmd.execute(ctx, {src.string(), dest.string(), "--ext", ".jpg"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(listFileNames(dest), (std::vector<std::string>{"a.jpg", "b.JPG"}));

    fs::path other = tempDir / "other";
    fs::create_directories(other);
    auto png = cmd.execute(ctx, {"--ext", "PNG", src.string(), other.string()});
    ASSERT_TRUE(png.has_value()) << png.error().message;
    EXPECT_EQ(listFileNames(other), (std::vector<std::string>{"c.png"}));
}

// Test: --max-attempts and --preserve-times are accepted
TEST_F(CopyCommandTest, AcceptsCollisionLimitAndTimes) {
    createFile(dest, "a.jpg", "old");
    createFile(dest, "a0.jpg", "old0");

    CopyCommand cmd;
    auto limited = cmd.execute(ctx, {src.string(), dest.string(), "--ext", "jpg", "--max-attempts", "1"});
    ASSERT_FALSE(limited.has_value());
    EXPECT_EQ(limited.error().code, ErrorCode::NameExhausted);

    auto ok = cmd.execute(ctx, {src.string(), dest.string(), "--ext", "jpg", "--max-attempts", "5", "--preserve-times"});
    ASSERT_TRUE(ok.has_value()) << ok.error().message;
    EXPECT_TRUE(fileHasContent(dest / "a.jpg", "old"));
    EXPECT_TRUE(fileHasContent(dest / "a0.jpg", "old0"));
    EXPECT_TRUE(fileHasContent(dest / "a1.jpg", "a"));
}

// Test: Bad arguments are rejected before anything is copied
TEST_F(CopyCommandTest, RejectsBadArguments) {
    CopyCommand cmd;
    const std::vector<std::vector<std::string>> cases{
        {},
        {src.string()},
        {src.string(), dest.string(), "extra"},
        {src.string(), dest.string(), "--ext"},
        {src.string(), dest.string(), "--ext", "."},
        {src.string(), dest.string(), "--max-attempts", "0"},
        {src.string(), dest.string(), "--max-attempts", "-3"},
        {src.string(), dest.string(), "--max-attempts", "many"},
        {src.string(), dest.string(), "--recursive"},
    };
    for (const auto& args : cases) {
        auto result = cmd.execute(ctx, args);
        ASSERT_FALSE(result.has_value()) << args.size();
        EXPECT_EQ(result.error().code, ErrorCode::InvalidArgs) << result.error().message;
    }
    EXPECT_TRUE(listFileNames(dest).empty());
}

// Test: Missing destination is not created
TEST_F(CopyCommandTest, MissingDestination) {
    CopyCommand cmd;
    auto result = cmd.execute(ctx, {src.string(), (tempDir / "nope").string()});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_FALSE(fs::exists(tempDir / "nope"));
}
