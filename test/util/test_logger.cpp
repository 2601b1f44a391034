#include <gtest/gtest.h>
#include <sstream>
#include "util/Logger.hpp"

using namespace batchfs;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        savedLevel = Logger::instance().level();
        Logger::instance().setSink(out, err);
    }

    void TearDown() override {
        Logger::instance().resetSink();
        Logger::instance().setLevel(savedLevel);
    }

    std::ostringstream out;
    std::ostringstream err;
    LogLevel savedLevel{LogLevel::Info};
};

// Test: Messages go to the injected sink with level prefixes
TEST_F(LoggerTest, WritesToInjectedSink) {
    Logger::instance().setLevel(LogLevel::Debug);
    Logger::instance().info("3 files copied");
    Logger::instance().debug("a -> b");
    Logger::instance().warn("careful");
    Logger::instance().error("boom");

    EXPECT_EQ(out.str(), "[info ] 3 files copied\n[debug] a -> b\n");
    EXPECT_EQ(err.str(), "[warn ] careful\n[error] boom\n");
}

// Test: Level filters lower-priority messages
TEST_F(LoggerTest, LevelFilters) {
    Logger::instance().setLevel(LogLevel::Warn);
    Logger::instance().info("hidden");
    Logger::instance().debug("hidden");
    Logger::instance().warn("shown");

    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str(), "[warn ] shown\n");
    EXPECT_EQ(Logger::instance().level(), LogLevel::Warn);
}
