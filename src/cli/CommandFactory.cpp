#include "cli/CommandFactory.hpp"

#include <stdexcept>

namespace folio {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    if (!creator) {
        throw std::invalid_argument("command '" + name + "' registered without a creator");
    }
    if (!creators.emplace(name, std::move(creator)).second) {
        throw std::logic_error("command '" + name + "' is already registered");
    }
}

bool CommandFactory::contains(const std::string& name) const {
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
    for (const auto& [name, creator] : creators) {
        out.emplace_back(creator());
    }
}

}
