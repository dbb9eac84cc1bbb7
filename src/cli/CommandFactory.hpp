#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace folio {

/**
 * @brief Registry mapping subcommand names to command creators
 *
 * The command set is fixed at startup by main(); lookups of anything else
 * return nullptr so the caller can print usage. Registering a name twice is
 * a programming error and throws std::logic_error.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();
    void registerCreator(const std::string& name, Creator creator);
    bool contains(const std::string& name) const;
    std::unique_ptr<ICommand> create(const std::string& name) const;

    /// Fresh instance of every registered command, in name order
    void listCommands(std::vector<std::unique_ptr<ICommand>>& out) const;

private:
    CommandFactory() = default;
    std::map<std::string, Creator> creators;   // ordered so help lists commands by name
};

}
