#include "cli/commands/BuildCommand.hpp"

#include <filesystem>
#include <iostream>

#include "cli/FlagParser.hpp"
#include "core/BuildPipeline.hpp"
#include "core/PandocConverter.hpp"
#include "core/SourceDiscovery.hpp"

namespace fs = std::filesystem;

namespace folio {

static Expected<void> requireFile(const fs::path& path, const char* what) {
    if (path.empty()) return {};
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Error{ErrorCode::ConfigError, std::string(what) + " not found: " + path.string()};
    }
    return {};
}

/**
 * @brief Execute 'folio build'
 *
 *   1. Discover content files (configuration errors stop here, before any work)
 *   2. Convert them on the worker pool
 *   3. Print a summary, then list every failed file on stderr
 *
 * Returns BuildFailed when at least one file failed, after all others were built.
 */
Expected<void> BuildCommand::execute(AppContext& ctx, const std::vector<std::string>& args) {
    SiteConfig config = ctx.config;
    auto parsed = parseFlags(name(), args,
                             {"--content", "--output", "--template", "--metadata",
                              "--jobs", "--depth", "--timeout", "--pandoc"},
                             config);
    if (!parsed) return parsed;

    if (auto t = requireFile(config.templatePath, "template"); !t) return t;
    if (auto m = requireFile(config.metadataPath, "metadata file"); !m) return m;

    DiscoveryOptions opts;
    opts.extension = config.contentExtension;
    opts.maxDepth = config.maxDepth;
    // Output placed inside the content tree must not be rebuilt as content
    opts.excluded.push_back(config.outputRoot);

    auto sources = discoverSources(config.contentRoot, opts);
    if (!sources) return sources.error();
    std::cout << "found " << sources.value().size() << " file(s) in " << config.contentRoot.string() << "\n";

    PandocConverter converter(config.pandocPath, config.timeout);
    BuildPipeline pipeline(config, converter);
    BuildReport report = pipeline.run(sources.value(), ctx.cancelled);

    std::cout << "built " << report.built << "/" << report.discovered << " file(s) into "
              << config.outputRoot.string() << "\n";

    if (!report.ok()) {
        for (const auto& f : report.failures) {
            std::cerr << "  failed: " << f.source.generic_string() << ": " << f.error.message << "\n";
        }
        return Error{ErrorCode::BuildFailed, std::to_string(report.failures.size()) + " of " +
                                                 std::to_string(report.discovered) +
                                                 " file(s) failed to convert"};
    }
    return {};
}

}
