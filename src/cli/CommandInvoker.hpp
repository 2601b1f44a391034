#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace batchfs {

class CommandInvoker {
public:
    /// Run cmd and log a failure as "<cmd>: [<code>] <message>"
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);

    /// 0 on success, 2 for usage errors, 1 for anything else
    static int exitCodeFor(const Expected<void>& result);
};

}
