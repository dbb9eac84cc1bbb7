#pragma once

#include "cli/ICommand.hpp"

namespace folio {

class BuildCommand : public ICommand {
public:
    Expected<void> execute(AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "build"; }
    const char* description() const override { return "Convert all content into the output directory"; }
    const char* helpNameLine() const override { return "build -  Render every markdown file to a self-contained HTML page"; }
    const char* helpSynopsis() const override {
        return "folio build [--content <dir>] [--output <dir>] [--template <file>] [--metadata <file>]\n"
               "            [--jobs <n>] [--depth <n>] [--timeout <seconds>] [--pandoc <path>]";
    }
    const char* helpDescription() const override {
        return "Walk the content directory, convert each markdown file with pandoc in parallel and write "
               "the result to the mirrored path under the output directory. Every file is attempted; the "
               "command fails if any conversion failed.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--content <dir>", "Content root (default: content, env FOLIO_CONTENT)"},
            {"--output <dir>", "Output root (default: public, env FOLIO_OUTPUT)"},
            {"--template <file>", "Pandoc HTML template (default: templates/default.html if present)"},
            {"--metadata <file>", "Metadata file shared by all pages (default: metadata.yaml if present)"},
            {"--jobs <n>", "Parallel conversions (default: number of hardware threads)"},
            {"--depth <n>", "Maximum directory depth to scan, 0 for unlimited (default: 0)"},
            {"--timeout <seconds>", "Per-file conversion limit, 0 for none (default: 0)"},
            {"--pandoc <path>", "Converter executable (default: pandoc)"},
        };
    }
};

}
