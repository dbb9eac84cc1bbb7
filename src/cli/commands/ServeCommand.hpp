#pragma once

#include "cli/ICommand.hpp"

namespace folio {

class ServeCommand : public ICommand {
public:
    Expected<void> execute(AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "serve"; }
    const char* description() const override { return "Preview the output directory over HTTP"; }
    const char* helpNameLine() const override { return "serve -  Serve the built site on a loopback address"; }
    const char* helpSynopsis() const override { return "folio serve [--output <dir>] [--host <addr>] [--port <n>]"; }
    const char* helpDescription() const override {
        return "Start a static file server rooted at the output directory. Runs until interrupted with "
               "Ctrl+C (SIGINT) or SIGTERM, then exits cleanly.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--output <dir>", "Directory to serve (default: public)"},
            {"--host <addr>", "Address to bind (default: 127.0.0.1)"},
            {"--port <n>", "Port to listen on (default: 8000, env FOLIO_PORT)"},
        };
    }
};

}
