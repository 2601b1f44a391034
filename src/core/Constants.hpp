#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief Default values shared by the core operations and the CLI
 */
namespace batchfs {

namespace Constants {
    // Sequential rename
    constexpr size_t DEFAULT_PADDING = 5;            // Width of the zero padded counter
    constexpr uint64_t DEFAULT_START_NUM = 0;        // First sequence number
    constexpr size_t MAX_PADDING = 255;              // NAME_MAX on common file systems

    // Manifest
    constexpr const char* DEFAULT_MANIFEST_PATH = "files_list.csv";
    constexpr const char* DEFAULT_SEPARATOR = ",";

    // Recursive copy
    constexpr size_t MAX_COLLISION_ATTEMPTS = 100000; // Numbered candidates probed per file
}
}
