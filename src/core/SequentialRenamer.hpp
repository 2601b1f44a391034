#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "core/Constants.hpp"
#include "util/Expected.hpp"

namespace batchfs {

/**
 * @brief Renames the files of one directory to a numbered scheme
 *
 * Naming scheme:
 *   <stem>_<NNNNN><ext>
 *
 * Where NNNNN is the sequence number zero padded to the requested width
 * and ext is the file's original extension (with its dot, possibly empty).
 *
 * Only the immediate regular files are renamed; subdirectories are skipped
 * and do not consume a number. Files are numbered in directory enumeration
 * order, which is not necessarily alphabetical.
 *
 * No collision checks are made. A file whose current name equals a name
 * generated later in the run can be replaced by the rename on platforms
 * where rename overwrites (POSIX).
 */
class SequentialRenamer {
public:
    /**
     * @brief Rename every regular file in dir
     * @param dir Existing directory
     * @param stem Non-empty name stem
     * @param padding Zero padding width of the counter, at most Constants::MAX_PADDING
     * @param startNum First sequence number
     * @return Number of files renamed, or the first error encountered
     *
     * The directory listing is taken before the first rename. A failed rename
     * stops the run; files renamed before it keep their new names.
     */
    static Expected<size_t> renameSequential(const std::filesystem::path& dir,
                                             const std::string& stem,
                                             size_t padding = Constants::DEFAULT_PADDING,
                                             uint64_t startNum = Constants::DEFAULT_START_NUM);

    /// Build "<stem>_<zero padded seq><ext>"; numbers wider than padding are not truncated
    static std::string makeSequenceName(const std::string& stem, uint64_t seq, size_t padding, const std::string& ext);
};

}
