#include "core/RecursiveCopier.hpp"

#include <string>

#include "util/CaseInsensitiveString.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace batchfs {

/**
 * @brief Extension of a file name without its leading dot
 *
 * Follows path::extension(): "a.tar.gz" -> "gz", ".profile" -> "", "README" -> "".
 */
static std::string bareExtension(const fs::path& fileName) {
    std::string ext = fileName.extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    return ext;
}

bool RecursiveCopier::matchesFilter(const fs::path& fileName) const {
    if (!opts.extension) return true;
    return CaseInsensitiveString(bareExtension(fileName)).equalsFold(*opts.extension);
}

Expected<fs::path> RecursiveCopier::resolveDestination(const fs::path& destDir, const fs::path& fileName) const {
    std::error_code ec;
    fs::path candidate = destDir / fileName;
    bool taken = fs::exists(candidate, ec);
    if (ec) return errorFromCode(ec, "cannot check " + candidate.string());
    if (!taken) return candidate;

    const std::string stem = fileName.stem().string();
    const std::string ext = fileName.extension().string();
    for (size_t seq = 0; seq < opts.maxCollisionAttempts; ++seq) {
        candidate = destDir / (stem + std::to_string(seq) + ext);
        taken = fs::exists(candidate, ec);
        if (ec) return errorFromCode(ec, "cannot check " + candidate.string());
        if (!taken) return candidate;
    }

    return Error{ErrorCode::NameExhausted,
                 "could not resolve destination name for " + fileName.string() + " after " +
                 std::to_string(opts.maxCollisionAttempts) + " attempts"};
}

Expected<size_t> RecursiveCopier::copyRecursively(const fs::path& src, const fs::path& dest) const {
    std::error_code ec;
    if (!fs::is_directory(src, ec)) {
        return Error{ErrorCode::NotFound, "source is not a directory: " + src.string()};
    }
    if (!fs::is_directory(dest, ec)) {
        return Error{ErrorCode::NotFound, "destination is not a directory: " + dest.string()};
    }

    // Used to keep the walk out of dest when dest is nested under src
    fs::path destCanon = fs::weakly_canonical(dest, ec);
    if (ec) return errorFromCode(ec, "cannot resolve " + dest.string());

    size_t copied = 0;
    std::error_code iterEc;
    for (auto it = fs::recursive_directory_iterator(src, iterEc); it != fs::recursive_directory_iterator(); it.increment(iterEc)) {
        if (iterEc) break;
        const fs::directory_entry& entry = *it;

        // An entry whose type cannot be read (dangling link) is neither
        std::error_code typeEc;
        if (entry.is_directory(typeEc)) {
            std::error_code canonEc;
            fs::path canon = fs::weakly_canonical(entry.path(), canonEc);
            if (canonEc) return errorFromCode(canonEc, "cannot resolve " + entry.path().string());
            if (canon == destCanon) {
                Logger::instance().debug("skipping destination directory " + entry.path().string());
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(typeEc)) continue;

        fs::path fileName = entry.path().filename();
        if (!matchesFilter(fileName)) continue;

        auto target = resolveDestination(dest, fileName);
        if (!target) return target.error();

        fs::copy_file(entry.path(), target.value(), fs::copy_options::none, ec);
        if (ec) return errorFromCode(ec, "cannot copy " + entry.path().string() + " to " + target.value().string());

        if (opts.preserveTimestamps) {
            auto mtime = fs::last_write_time(entry.path(), ec);
            if (!ec) fs::last_write_time(target.value(), mtime, ec);
            if (ec) return errorFromCode(ec, "cannot set timestamp on " + target.value().string());
        }

        Logger::instance().debug(entry.path().string() + " -> " + target.value().string());
        ++copied;
    }
    if (iterEc) return errorFromCode(iterEc, "cannot traverse " + src.string());

    Logger::instance().info(std::to_string(copied) + " files copied");
    return copied;
}

}
