#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "util/Expected.hpp"

namespace batchfs {

/**
 * @brief Size and modification time of a single file
 */
struct FileMetadata {
    uint64_t sizeBytes{0};   // File size in bytes
    int64_t mtimeNs{0};      // Last modification time, nanoseconds since the Unix epoch
};

/**
 * @brief Read file metadata from filesystem
 *
 * Reads st_size and st_mtim with POSIX stat(), so the timestamp is the
 * file's exact modification time relative to the Unix epoch.
 *
 * @param filePath Path to file
 * @return FileMetadata, or the stat error mapped through errorFromCode
 */
Expected<FileMetadata> getFileMetadata(const std::filesystem::path& filePath);

/**
 * @brief Render a nanosecond timestamp as epoch seconds
 *
 * Whole seconds, a dot, then the fractional part with trailing zeros
 * removed. A whole-second value keeps a single zero ("1700000000.0").
 */
std::string formatEpochSeconds(int64_t mtimeNs);

}
