#include "cli/commands/ListCommand.hpp"

#include "cli/ArgParse.hpp"
#include "core/Constants.hpp"
#include "core/ManifestWriter.hpp"

namespace batchfs {

/**
 * @brief Execute 'batchfs list' command
 *
 * The mode is validated before the output file is opened, so an unknown
 * mode leaves an existing manifest untouched.
 */
Expected<void> ListCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    std::string mode = "simple";
    std::string output = Constants::DEFAULT_MANIFEST_PATH;
    std::string separator = Constants::DEFAULT_SEPARATOR;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--mode" || arg == "--output" || arg == "--sep") {
            auto v = ArgParse::takeValue(args, i);
            if (!v) return v.error();
            if (arg == "--mode") {
                mode = v.value();
            } else if (arg == "--output") {
                output = v.value();
            } else {
                separator = ArgParse::unescapeSeparator(v.value());
            }
        } else if (ArgParse::isOption(arg)) {
            return Error{ErrorCode::InvalidArgs, "list: unknown option " + arg};
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "list: expected <dir>"};
    }

    auto res = ManifestWriter::listFiles(positional[0], mode, output, separator);
    if (!res) return res.error();
    return {};
}

}
