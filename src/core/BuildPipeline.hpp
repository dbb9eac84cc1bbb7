#pragma once

#include <atomic>
#include <filesystem>
#include <vector>

#include "core/IConverter.hpp"
#include "core/SiteConfig.hpp"
#include "util/Expected.hpp"

namespace folio {

/// One content file that did not make it into the output tree
struct BuildFailure {
    std::filesystem::path source;   // relative to the content root
    Error error;
};

/// Aggregate outcome of a pipeline run
struct BuildReport {
    size_t discovered{0};
    size_t built{0};
    std::vector<BuildFailure> failures;   // sorted by source path

    bool ok() const { return failures.empty(); }
};

/**
 * @brief Converts content files into the output tree in parallel
 *
 * Each file is an independent task on a bounded worker pool
 * (SiteConfig::jobs threads). A task:
 *   1. maps `<content>/<rel>.md` to `<output>/<rel>.html`
 *   2. creates the destination's parent directories
 *   3. reads the source front-matter (defaults when absent or malformed)
 *   4. converts into `<dest>.tmp`, then renames onto `<dest>`
 *
 * Failures are collected rather than propagated, so one bad file never stops
 * its siblings, and the staging file is removed so no partial output remains.
 * run() returns only after every task has finished.
 */
class BuildPipeline {
public:
    BuildPipeline(const SiteConfig& config, const IConverter& converter);

    /**
     * @brief Build every listed source
     * @param sources Paths relative to the content root (from discoverSources)
     * @param cancel When set, tasks that have not started yet fail as Cancelled
     */
    BuildReport run(const std::vector<std::filesystem::path>& sources,
                    const std::atomic<bool>& cancel) const;

    /// Build a single source synchronously
    Expected<void> buildOne(const std::filesystem::path& relative) const;

private:
    const SiteConfig& config;
    const IConverter& converter;
};

}
