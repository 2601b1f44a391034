// batchfs CLI entry: dispatches to copy / rename / list / help commands.

#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "util/Logger.hpp"

using namespace batchfs;

int main(int argc, char** argv) {
    CommandFactory::instance().registerBuiltins();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    AppContext ctx{};
    CommandInvoker invoker;
    if (args.empty()) {
        auto cmd = CommandFactory::instance().create("help");
        return CommandInvoker::exitCodeFor(invoker.invoke(*cmd, ctx, {}));
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        Logger::instance().error("Unknown command: " + cmdName);
        auto help = CommandFactory::instance().create("help");
        invoker.invoke(*help, ctx, {});
        return 1;
    }
    auto res = invoker.invoke(*cmd, ctx, args);
    return CommandInvoker::exitCodeFor(res);
}
