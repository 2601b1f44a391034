#include "cli/commands/RenameCommand.hpp"

#include "cli/ArgParse.hpp"
#include "core/Constants.hpp"
#include "core/SequentialRenamer.hpp"

namespace batchfs {

Expected<void> RenameCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    size_t padding = Constants::DEFAULT_PADDING;
    uint64_t start = Constants::DEFAULT_START_NUM;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--padding" || arg == "--start") {
            auto v = ArgParse::takeValue(args, i);
            if (!v) return v.error();
            auto n = ArgParse::parseUnsigned(arg, v.value());
            if (!n) return n.error();
            if (arg == "--padding") {
                if (n.value() > Constants::MAX_PADDING) {
                    return Error{ErrorCode::InvalidArgs, "rename: --padding must be at most " +
                                                         std::to_string(Constants::MAX_PADDING)};
                }
                padding = static_cast<size_t>(n.value());
            } else {
                start = n.value();
            }
        } else if (ArgParse::isOption(arg)) {
            return Error{ErrorCode::InvalidArgs, "rename: unknown option " + arg};
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        return Error{ErrorCode::InvalidArgs, "rename: expected <dir> <stem>"};
    }

    auto res = SequentialRenamer::renameSequential(positional[0], positional[1], padding, start);
    if (!res) return res.error();
    return {};
}

}
