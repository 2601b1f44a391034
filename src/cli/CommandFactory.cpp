#include "cli/CommandFactory.hpp"

#include <algorithm>

#include "cli/commands/CopyCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/ListCommand.hpp"
#include "cli/commands/RenameCommand.hpp"

namespace batchfs {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerBuiltins() {
    registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    registerCreator("copy", [] { return std::make_unique<CopyCommand>(); });
    registerCreator("rename", [] { return std::make_unique<RenameCommand>(); });
    registerCreator("list", [] { return std::make_unique<ListCommand>(); });
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

bool CommandFactory::has(const std::string& name) const {
    return creators.find(name) != creators.end();
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::string(a->name()) < std::string(b->name());
    });
}

}
