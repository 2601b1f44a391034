#include "core/ManifestWriter.hpp"

#include <fstream>

#include "util/FileMetadata.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace batchfs {

Expected<ManifestMode> parseManifestMode(const std::string& text) {
    if (text == "simple") return ManifestMode::Simple;
    if (text == "full") return ManifestMode::Full;
    return Error{ErrorCode::UnsupportedMode, "unsupported mode '" + text + "' (expected 'simple' or 'full')"};
}

const char* manifestModeName(ManifestMode mode) {
    switch (mode) {
        case ManifestMode::Simple: return "simple";
        case ManifestMode::Full: return "full";
    }
    return "unknown";
}

std::string ManifestWriter::header(ManifestMode mode, const std::string& separator) {
    if (mode == ManifestMode::Full) {
        return "location" + separator + "filename" + separator + "size" + separator + "last_modified";
    }
    return "file_name";
}

Expected<size_t> ManifestWriter::listFiles(const fs::path& dir, const std::string& mode,
                                           const fs::path& outputPath, const std::string& separator) {
    auto parsed = parseManifestMode(mode);
    if (!parsed) return parsed.error();
    return listFiles(dir, parsed.value(), outputPath, separator);
}

Expected<size_t> ManifestWriter::listFiles(const fs::path& dir, ManifestMode mode,
                                           const fs::path& outputPath, const std::string& separator) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Error{ErrorCode::NotFound, "not a directory: " + dir.string()};
    }

    std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
    if (!out) return Error{ErrorCode::IoError, "cannot open " + outputPath.string() + " for writing"};

    out << header(mode, separator) << "\n";

    size_t rows = 0;
    for (auto it = fs::directory_iterator(dir, ec); it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code typeEc;
        if (!it->is_regular_file(typeEc)) continue;

        const std::string name = it->path().filename().string();
        if (mode == ManifestMode::Full) {
            auto meta = getFileMetadata(it->path());
            if (!meta) return meta.error();
            out << dir.string() << separator << name << separator << meta.value().sizeBytes
                << separator << formatEpochSeconds(meta.value().mtimeNs) << "\n";
        } else {
            out << name << "\n";
        }
        if (!out) return Error{ErrorCode::IoError, "failed writing " + outputPath.string()};
        ++rows;
    }
    if (ec) return errorFromCode(ec, "cannot list " + dir.string());

    out.flush();
    if (!out) return Error{ErrorCode::IoError, "failed writing " + outputPath.string()};

    Logger::instance().info(std::to_string(rows) + " files listed in " + outputPath.string() +
                            " (" + manifestModeName(mode) + ")");
    return rows;
}

}
