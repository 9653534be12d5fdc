#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace evidhash {

/**
 * @brief Name -> command registry
 *
 * Commands are created fresh per invocation. Names are kept ordered so
 * listings come out sorted without a separate pass.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();

    void registerCreator(const std::string& name, Creator creator);
    std::unique_ptr<ICommand> create(const std::string& name) const;
    bool contains(const std::string& name) const { return creators.count(name) != 0; }

    /// One instance of every registered command, in name order
    std::vector<std::unique_ptr<ICommand>> listCommands() const;

private:
    CommandFactory() = default;
    std::map<std::string, Creator> creators;
};

/// Register hash, detect and help with the global factory (idempotent)
void registerBuiltinCommands();

}
