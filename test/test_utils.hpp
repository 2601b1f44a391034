#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace batchfs::test {

/**
 * @brief Test utilities for batchfs tests
 *
 * Provides helper functions for creating temporary directory trees,
 * test files, and reading back results.
 */
namespace utils {

/**
 * @brief Create a temporary directory for testing
 * @return Path to temporary directory
 */
std::filesystem::path createTempDir();

/**
 * @brief Remove a directory and all its contents
 * @param dir Directory to remove
 */
void removeDir(const std::filesystem::path& dir);

/**
 * @brief Create a file with content in the given directory
 * @param baseDir Base directory
 * @param filename File name (may contain subdirectories, created as needed)
 * @param content File content
 * @return Full path to created file
 */
std::filesystem::path createFile(
    const std::filesystem::path& baseDir,
    const std::string& filename,
    const std::string& content = ""
);

/**
 * @brief Create multiple files in a directory
 * @param baseDir Base directory
 * @param files Vector of filename-content pairs
 */
void createFiles(
    const std::filesystem::path& baseDir,
    const std::vector<std::pair<std::string, std::string>>& files
);

/**
 * @brief Read file content
 * @param filePath Path to file
 * @return File content as string
 */
std::string readFile(const std::filesystem::path& filePath);

/**
 * @brief Check if a file exists and has given content
 * @param filePath Path to file
 * @param expectedContent Expected content
 * @return True if file exists and content matches
 */
bool fileHasContent(const std::filesystem::path& filePath, const std::string& expectedContent);

/**
 * @brief Read a text file as lines (without the '\n')
 */
std::vector<std::string> readLines(const std::filesystem::path& filePath);

/**
 * @brief Sorted names of the regular files directly inside dir
 */
std::vector<std::string> listFileNames(const std::filesystem::path& dir);

/**
 * @brief Split text on every occurrence of sep
 */
std::vector<std::string> split(const std::string& text, const std::string& sep);

/**
 * @brief Set a file's modification time to an exact epoch value
 * @return true on success
 */
bool setMtime(const std::filesystem::path& filePath, int64_t seconds, long nanoseconds = 0);

} // namespace utils

} // namespace batchfs::test
