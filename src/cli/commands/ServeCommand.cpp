#include "cli/commands/ServeCommand.hpp"

#include "cli/FlagParser.hpp"
#include "server/StaticServer.hpp"

namespace folio {

Expected<void> ServeCommand::execute(AppContext& ctx, const std::vector<std::string>& args) {
    SiteConfig config = ctx.config;
    auto parsed = parseFlags(name(), args, {"--output", "--host", "--port"}, config);
    if (!parsed) return parsed;

    StaticServer server(config.outputRoot, config.serveHost, config.servePort);
    return server.run();
}

}
