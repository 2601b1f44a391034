#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace batchfs {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = cmd.execute(ctx, args);
    if (!res) {
        Logger::instance().error(std::string(cmd.name()) + ": [" + errorCodeName(res.error().code) + "] " +
                                 res.error().message);
        return res;
    }
    return {};
}

int CommandInvoker::exitCodeFor(const Expected<void>& result) {
    if (result) return 0;
    switch (result.error().code) {
        case ErrorCode::InvalidArgs:
        case ErrorCode::UnsupportedMode:
            return 2;
        default:
            return 1;
    }
}

}
