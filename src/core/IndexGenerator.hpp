#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/SiteConfig.hpp"
#include "util/Expected.hpp"

namespace folio {

/// Listing record derived from one post's front-matter
struct IndexEntry {
    std::string title;
    std::string subtitle;
    std::string date;        // YYYY-MM-DD, empty when the post has none
    std::string wordCount;
    std::string link;        // output path relative to the listing's directory, e.g. posts/intro.html
};

/**
 * @brief Builds the post listing page from front-matter
 *
 * Scans `<content>/<section>` one level deep, reads each post's
 * front-matter and writes `<content>/<indexFile>`, a markdown document
 * listing the posts newest first. The listing is itself a content file and
 * is converted by the next build.
 *
 * Posts without front-matter or without a `date` still appear (title falls
 * back to the file stem) and are listed after every dated post. A `date`
 * that is present but not a valid YYYY-MM-DD fails the whole listing.
 */
class IndexGenerator {
public:
    explicit IndexGenerator(const SiteConfig& config);

    /// Collect entries sorted by date, newest first, undated last; ties keep path order
    Expected<std::vector<IndexEntry>> collect() const;

    /// Render entries into a complete content file (with its own front-matter)
    std::string render(const std::vector<IndexEntry>& entries) const;

    /// collect + render + atomic write; returns the number of entries written
    Expected<size_t> generate() const;

    /// Where generate() writes the listing
    std::filesystem::path indexPath() const;

private:
    const SiteConfig& config;
};

}
