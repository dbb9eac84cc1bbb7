#include "cli/commands/CleanCommand.hpp"

#include <iostream>

#include "cli/FlagParser.hpp"
#include "core/OutputTree.hpp"

namespace folio {

Expected<void> CleanCommand::execute(AppContext& ctx, const std::vector<std::string>& args) {
    SiteConfig config = ctx.config;
    auto parsed = parseFlags(name(), args, {"--output", "--content"}, config);
    if (!parsed) return parsed;

    auto removed = removeOutputTree(config.outputRoot, config.contentRoot);
    if (!removed) return removed.error();

    if (removed.value() == 0) {
        std::cout << "nothing to clean at " << config.outputRoot.string() << "\n";
    } else {
        std::cout << "removed " << config.outputRoot.string() << " (" << removed.value() << " entries)\n";
    }
    return {};
}

}
