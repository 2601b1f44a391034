#include "cli/commands/HelpCommand.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "util/Logger.hpp"

namespace batchfs {

namespace {

void printCommandDetail(std::ostream& out, const ICommand& cmd) {
    out << "NAME:\n" << cmd.helpNameLine() << "\n\n";
    out << "SYNOPSIS:\n" << cmd.helpSynopsis() << "\n\n";
    out << "DESCRIPTION:\n" << cmd.helpDescription() << "\n\n";
    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        out << "OPTIONS:\n";
        for (const auto& [opt, desc] : opts) {
            out << "  " << opt << "\n      " << desc << "\n";
        }
        out << "\n";
    }
}

}

Expected<void> HelpCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::ostream& out = *ctx.out;
    if (!args.empty()) {
        const std::string& topic = args.front();
        auto cmd = CommandFactory::instance().create(topic);
        if (cmd) {
            printCommandDetail(out, *cmd);
            return {};
        }
        Logger::instance().warn("Unknown help topic: " + topic);
    }

    std::vector<std::unique_ptr<ICommand>> cmds;
    CommandFactory::instance().listCommands(cmds);

    out << "usage: batchfs <command> [<args>]\n\n";
    out << "Commands:\n";
    for (const auto& c : cmds) {
        out << "  " << c->name() << "\t" << c->description() << "\n";
    }
    out << "\nSee 'batchfs help <command>' for details.\n";
    return {};
}

}
