// folio: static-site builder for a markdown blog.

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "cli/commands/BuildCommand.hpp"
#include "cli/commands/CleanCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/IndexCommand.hpp"
#include "cli/commands/ServeCommand.hpp"
#include "core/Constants.hpp"
#include "util/Logger.hpp"

using namespace folio;

static void registerCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("build", [] { return std::make_unique<BuildCommand>(); });
    f.registerCreator("serve", [] { return std::make_unique<ServeCommand>(); });
    f.registerCreator("clean", [] { return std::make_unique<CleanCommand>(); });
    f.registerCreator("index", [] { return std::make_unique<IndexCommand>(); });
}

int main(int argc, char** argv) {
    registerCommands();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    AppContext ctx{};
    CommandInvoker invoker;
    if (args.empty() || args.front() == "-h" || args.front() == "--help") {
        auto cmd = CommandFactory::instance().create("help");
        invoker.invoke(*cmd, ctx, {});
        return Constants::EXIT_OK;
    }

    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        auto help = CommandFactory::instance().create("help");
        invoker.invoke(*help, ctx, {});
        return Constants::EXIT_USAGE;
    }

    // Configuration is resolved once, before any command does work
    auto config = SiteConfig::fromEnvironment();
    if (!config) {
        Logger::instance().error(config.error().message);
        return exitCodeFor(config.error().code);
    }
    ctx.config = config.value();

    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? Constants::EXIT_OK : exitCodeFor(res.error().code);
}
