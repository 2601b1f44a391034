#include "cli/commands/CopyCommand.hpp"

#include <filesystem>

#include "cli/ArgParse.hpp"
#include "core/RecursiveCopier.hpp"

namespace batchfs {

/**
 * @brief Execute 'batchfs copy' command
 *
 * Supports:
 *   --ext <ext>          : extension filter; a leading dot is stripped
 *   --max-attempts <n>   : collision probe limit (must be > 0)
 *   --preserve-times     : carry mtime over to the copy
 *
 * The copy count is reported through the logger by the copier.
 */
Expected<void> CopyCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    CopyOptions opts;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--ext") {
            auto v = ArgParse::takeValue(args, i);
            if (!v) return v.error();
            std::string ext = v.value();
            if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
            if (ext.empty()) return Error{ErrorCode::InvalidArgs, "copy: --ext must not be empty"};
            opts.extension = ext;
        } else if (arg == "--max-attempts") {
            auto v = ArgParse::takeValue(args, i);
            if (!v) return v.error();
            auto n = ArgParse::parseUnsigned(arg, v.value());
            if (!n) return n.error();
            if (n.value() == 0) return Error{ErrorCode::InvalidArgs, "copy: --max-attempts must be at least 1"};
            opts.maxCollisionAttempts = static_cast<size_t>(n.value());
        } else if (arg == "--preserve-times") {
            opts.preserveTimestamps = true;
        } else if (ArgParse::isOption(arg)) {
            return Error{ErrorCode::InvalidArgs, "copy: unknown option " + arg};
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        return Error{ErrorCode::InvalidArgs, "copy: expected <src> <dest>"};
    }

    RecursiveCopier copier(opts);
    auto res = copier.copyRecursively(positional[0], positional[1]);
    if (!res) return res.error();
    return {};
}

}
