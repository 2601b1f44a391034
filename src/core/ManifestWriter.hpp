#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "core/Constants.hpp"
#include "util/Expected.hpp"

namespace batchfs {

enum class ManifestMode { Simple, Full };

/// Parse "simple" or "full"; anything else is UnsupportedMode
Expected<ManifestMode> parseManifestMode(const std::string& text);

const char* manifestModeName(ManifestMode mode);

/**
 * @brief Writes a delimited listing of the files in one directory
 *
 * Output format (one line per entry, '\n' terminated):
 *   simple: header "file_name", rows "<name>"
 *   full:   header "location<sep>filename<sep>size<sep>last_modified",
 *           rows "<dir><sep><name><sep><bytes><sep><epoch seconds>"
 *
 * Only immediate regular files are listed, in directory enumeration order.
 * <dir> is the directory exactly as passed in. The output file is created
 * before the listing is read, so an output path inside the listed
 * directory appears in its own manifest.
 */
class ManifestWriter {
public:
    /**
     * @brief Write the manifest of dir to outputPath (truncating it)
     * @return Number of data rows written, or the first error encountered
     */
    static Expected<size_t> listFiles(const std::filesystem::path& dir,
                                      ManifestMode mode = ManifestMode::Simple,
                                      const std::filesystem::path& outputPath = Constants::DEFAULT_MANIFEST_PATH,
                                      const std::string& separator = Constants::DEFAULT_SEPARATOR);

    /// Same as above, but validates the textual mode before touching any file
    static Expected<size_t> listFiles(const std::filesystem::path& dir,
                                      const std::string& mode,
                                      const std::filesystem::path& outputPath,
                                      const std::string& separator);

    /// Header line (without newline) for the given mode
    static std::string header(ManifestMode mode, const std::string& separator);
};

}
