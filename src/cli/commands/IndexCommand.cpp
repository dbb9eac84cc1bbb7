#include "cli/commands/IndexCommand.hpp"

#include <iostream>

#include "cli/FlagParser.hpp"
#include "core/IndexGenerator.hpp"

namespace folio {

Expected<void> IndexCommand::execute(AppContext& ctx, const std::vector<std::string>& args) {
    SiteConfig config = ctx.config;
    auto parsed = parseFlags(name(), args, {"--content", "--section", "--file", "--title"}, config);
    if (!parsed) return parsed;

    IndexGenerator generator(config);
    auto count = generator.generate();
    if (!count) return count.error();

    std::cout << "indexed " << count.value() << " post(s) into " << generator.indexPath().string() << "\n";
    return {};
}

}
