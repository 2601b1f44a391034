#include <gtest/gtest.h>

#include <cstdlib>

#include "cli/CommandFactory.hpp"
#include "util/Logger.hpp"

/**
 * @brief Main entry point for batchfs unit tests
 *
 * Registers the built-in commands once (help looks them up through the
 * factory) and quiets info logging unless BATCHFS_LOG asks for it.
 *
 * Run with: ./batchfs_tests
 * Or with CMake CTest: ctest --output-on-failure
 */

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    batchfs::CommandFactory::instance().registerBuiltins();
    if (!std::getenv("BATCHFS_LOG")) {
        batchfs::Logger::instance().setLevel(batchfs::LogLevel::Warn);
    }
    return RUN_ALL_TESTS();
}
