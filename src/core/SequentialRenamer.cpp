#include "core/SequentialRenamer.hpp"

#include <vector>

#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace batchfs {

std::string SequentialRenamer::makeSequenceName(const std::string& stem, uint64_t seq, size_t padding, const std::string& ext) {
    std::string number = std::to_string(seq);
    if (number.size() < padding) number.insert(0, padding - number.size(), '0');
    return stem + "_" + number + ext;
}

Expected<size_t> SequentialRenamer::renameSequential(const fs::path& dir, const std::string& stem, size_t padding, uint64_t startNum) {
    if (stem.empty()) {
        return Error{ErrorCode::InvalidArgs, "rename: stem must not be empty"};
    }
    if (padding > Constants::MAX_PADDING) {
        return Error{ErrorCode::InvalidArgs, "rename: padding " + std::to_string(padding) +
                                             " exceeds " + std::to_string(Constants::MAX_PADDING)};
    }
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Error{ErrorCode::NotFound, "not a directory: " + dir.string()};
    }

    // Snapshot the listing so renamed files are not enumerated again
    std::vector<fs::path> files;
    for (auto it = fs::directory_iterator(dir, ec); it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code typeEc;
        if (it->is_regular_file(typeEc)) {
            files.push_back(it->path());
        }
    }
    if (ec) return errorFromCode(ec, "cannot list " + dir.string());

    uint64_t seq = startNum;
    for (const auto& file : files) {
        fs::path target = dir / makeSequenceName(stem, seq, padding, file.extension().string());
        fs::rename(file, target, ec);
        if (ec) return errorFromCode(ec, "cannot rename " + file.string() + " to " + target.string());
        Logger::instance().debug(file.filename().string() + " -> " + target.filename().string());
        ++seq;
    }

    size_t renamed = static_cast<size_t>(seq - startNum);
    Logger::instance().info(std::to_string(renamed) + " files renamed");
    return renamed;
}

}
