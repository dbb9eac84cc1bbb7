#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace folio {

struct DiscoveryOptions {
    std::string extension{".md"};   // matched case-sensitively against the file extension
    size_t maxDepth{0};             // files directly under root are depth 1; 0 = unbounded
    std::vector<std::filesystem::path> excluded;  // absolute directories never entered
};

/**
 * @brief Enumerate content files under a root directory
 *
 * Walks `root` recursively and returns every regular file whose extension
 * matches, as a path relative to `root`, sorted by generic string so builds
 * are reproducible.
 *
 * Skipped silently:
 *   - symlinks (files and directories alike, never followed)
 *   - hidden entries (name starts with '.')
 *   - entries deeper than maxDepth
 *   - directories listed in options.excluded
 *
 * @return Relative paths (possibly empty), or ConfigError if root is missing
 *         or not a directory, IoError if the walk fails part-way
 */
Expected<std::vector<std::filesystem::path>> discoverSources(const std::filesystem::path& root,
                                                             const DiscoveryOptions& options);

/**
 * @brief Map a relative content path to its output location
 *
 * `posts/intro.md` under outputRoot `public` with extension `.html`
 * becomes `public/posts/intro.html`.
 */
std::filesystem::path mapOutputPath(const std::filesystem::path& relative,
                                    const std::filesystem::path& outputRoot,
                                    const std::string& outputExtension);

}
