#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "cli/ICommand.hpp"

namespace batchfs {

/**
 * @brief Name -> command registry used by main() and the help command
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();

    /// Register help, copy, rename and list (idempotent)
    void registerBuiltins();

    void registerCreator(const std::string& name, Creator creator);
    bool has(const std::string& name) const;
    std::unique_ptr<ICommand> create(const std::string& name) const;

    /// Instantiate every registered command, sorted by name
    void listCommands(std::vector<std::unique_ptr<ICommand>>& out) const;

private:
    CommandFactory() = default;
    std::unordered_map<std::string, Creator> creators;
};

}
