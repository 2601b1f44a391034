#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "core/Constants.hpp"
#include "util/Expected.hpp"

namespace batchfs {

struct CopyOptions {
    std::optional<std::string> extension;                          // Filter without leading dot; nullopt copies everything
    size_t maxCollisionAttempts{Constants::MAX_COLLISION_ATTEMPTS}; // Numbered names tried before giving up
    bool preserveTimestamps{false};                                 // Copy source mtime onto the destination
};

/**
 * @brief Flattening copy of a directory tree into a single directory
 *
 * Walks the source tree recursively and copies every regular file whose
 * extension matches the filter (case-insensitive) into the destination
 * directory. Subdirectory structure is dropped, so equally named files
 * from different subdirectories collide; a collision is resolved by
 * inserting a sequence number between the stem and the extension:
 *
 *   photo.jpg -> photo.jpg, photo0.jpg, photo1.jpg, ...
 *
 * An existing destination file is never overwritten.
 *
 * Usage:
 *   CopyOptions opts;
 *   opts.extension = "jpg";
 *   RecursiveCopier copier(opts);
 *   auto res = copier.copyRecursively("/camera", "/photos");
 */
class RecursiveCopier {
public:
    RecursiveCopier() = default;
    explicit RecursiveCopier(CopyOptions options) : opts(std::move(options)) {}

    /**
     * @brief Copy matching files from src (recursively) into dest
     * @param src Existing source directory
     * @param dest Existing destination directory (not created)
     * @return Number of files copied, or the first error encountered
     *
     * Errors abort the walk; files copied before the error stay in place.
     * If dest lies inside src its subtree is not traversed.
     */
    Expected<size_t> copyRecursively(const std::filesystem::path& src, const std::filesystem::path& dest) const;

    /**
     * @brief Find an unused name for fileName inside destDir
     * @return destDir/fileName if free, else the first free destDir/<stem><n><ext>
     *         for n = 0, 1, 2, ...; NameExhausted once maxCollisionAttempts
     *         numbered candidates are all taken
     */
    Expected<std::filesystem::path> resolveDestination(const std::filesystem::path& destDir,
                                                       const std::filesystem::path& fileName) const;

    /// True if the file's extension matches the configured filter
    bool matchesFilter(const std::filesystem::path& fileName) const;

    const CopyOptions& options() const { return opts; }

private:
    CopyOptions opts{};
};

}
