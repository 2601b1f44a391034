#include "util/FileMetadata.hpp"

#include <cerrno>
#include <filesystem>
#include <system_error>

#include <sys/stat.h>

namespace batchfs {

Expected<FileMetadata> getFileMetadata(const std::filesystem::path& filePath) {
    // st_mtim is already relative to the Unix epoch
    struct stat st{};
    if (::stat(filePath.c_str(), &st) != 0) {
        return errorFromCode(std::error_code(errno, std::generic_category()), "cannot stat " + filePath.string());
    }

    FileMetadata metadata;
    metadata.sizeBytes = static_cast<uint64_t>(st.st_size);
    metadata.mtimeNs = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000 + static_cast<int64_t>(st.st_mtim.tv_nsec);
    return metadata;
}

std::string formatEpochSeconds(int64_t mtimeNs) {
    constexpr uint64_t NS_PER_SEC = 1000000000;
    // Pre-epoch times: format the magnitude and prefix the sign
    bool negative = mtimeNs < 0;
    uint64_t magnitude = negative ? 0 - static_cast<uint64_t>(mtimeNs) : static_cast<uint64_t>(mtimeNs);
    uint64_t secs = magnitude / NS_PER_SEC;
    uint64_t frac = magnitude % NS_PER_SEC;

    std::string digits = std::to_string(frac);
    digits.insert(0, 9 - digits.size(), '0');
    while (digits.size() > 1 && digits.back() == '0') digits.pop_back();

    return (negative ? "-" : "") + std::to_string(secs) + "." + digits;
}

}
