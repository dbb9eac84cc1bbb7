#pragma once

#include "cli/ICommand.hpp"

namespace folio {

class CleanCommand : public ICommand {
public:
    Expected<void> execute(AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "clean"; }
    const char* description() const override { return "Delete the output directory"; }
    const char* helpNameLine() const override { return "clean -  Remove generated files"; }
    const char* helpSynopsis() const override { return "folio clean [--output <dir>] [--content <dir>]"; }
    const char* helpDescription() const override {
        return "Remove the output directory tree and nothing else. Succeeds when there is nothing to remove. "
               "Refuses to delete the current directory, the filesystem root or anything containing the "
               "content directory.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--output <dir>", "Directory to remove (default: public)"},
            {"--content <dir>", "Content root that must never be touched (default: content)"},
        };
    }
};

}
