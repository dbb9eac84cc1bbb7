#pragma once

#include "cli/ICommand.hpp"

namespace folio {

class IndexCommand : public ICommand {
public:
    Expected<void> execute(AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "index"; }
    const char* description() const override { return "Regenerate the post listing page"; }
    const char* helpNameLine() const override { return "index -  Write a date-sorted listing of posts"; }
    const char* helpSynopsis() const override {
        return "folio index [--content <dir>] [--section <dir>] [--file <name>] [--title <text>]";
    }
    const char* helpDescription() const override {
        return "Read the front-matter of every post directly inside the section directory and write a "
               "markdown listing, newest first, into the content root. Every post needs a 'date: YYYY-MM-DD' "
               "line; the listing is not written if any date is missing or malformed.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--content <dir>", "Content root (default: content)"},
            {"--section <dir>", "Directory of posts, relative to the content root (default: posts)"},
            {"--file <name>", "Listing file written into the content root (default: posts.md)"},
            {"--title <text>", "Title of the listing page (default: Posts)"},
        };
    }
};

}
