#include "core/IndexGenerator.hpp"

#include <algorithm>
#include <sstream>

#include "core/FrontMatter.hpp"
#include "core/SourceDiscovery.hpp"
#include "util/FileIO.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace folio {

IndexGenerator::IndexGenerator(const SiteConfig& config) : config(config) {}

fs::path IndexGenerator::indexPath() const {
    return config.contentRoot / config.indexFile;
}

Expected<std::vector<IndexEntry>> IndexGenerator::collect() const {
    fs::path sectionDir = config.contentRoot / config.indexSection;

    DiscoveryOptions opts;
    opts.extension = config.contentExtension;
    opts.maxDepth = 1;
    auto found = discoverSources(sectionDir, opts);
    if (!found) return found.error();

    std::error_code ec;
    fs::path self = fs::weakly_canonical(indexPath(), ec);

    std::vector<IndexEntry> entries;
    for (const auto& rel : found.value()) {
        fs::path file = sectionDir / rel;
        if (!self.empty() && fs::weakly_canonical(file, ec) == self) continue;

        auto text = readTextFile(file);
        if (!text) return text.error();

        auto fm = parseFrontMatter(text.value(), FrontMatter::defaultsFor(file));
        if (!fm) {
            return Error{ErrorCode::MetadataError, file.string() + ": " + fm.error().message};
        }
        const FrontMatter& meta = fm.value();
        if (!meta.date.empty() && !isIsoDate(meta.date)) {
            return Error{ErrorCode::MetadataError,
                         file.string() + ": date '" + meta.date + "' is not YYYY-MM-DD"};
        }

        IndexEntry e;
        e.title = meta.title;
        e.subtitle = meta.subtitle;
        e.date = meta.date;
        e.wordCount = meta.wordCount;
        // Relative to the listing's own page so links resolve wherever it is placed
        e.link = fs::path(file)
                     .replace_extension(config.outputExtension)
                     .lexically_relative(indexPath().parent_path())
                     .generic_string();
        entries.push_back(std::move(e));
    }

    // ISO dates compare correctly as strings; undated posts go last
    std::stable_sort(entries.begin(), entries.end(), [](const IndexEntry& a, const IndexEntry& b) {
        if (a.date.empty() != b.date.empty()) return b.date.empty();
        return a.date > b.date;
    });
    return entries;
}

std::string IndexGenerator::render(const std::vector<IndexEntry>& entries) const {
    std::ostringstream out;
    out << "---\n";
    out << "title: " << config.indexTitle << "\n";
    out << "---\n";

    for (const auto& e : entries) {
        out << "\n## [" << e.title << "](" << e.link << ")\n\n";
        if (!e.subtitle.empty()) out << "*" << e.subtitle << "*\n\n";
        std::string details = e.date;
        if (!e.wordCount.empty()) details += (details.empty() ? "" : " · ") + e.wordCount;
        if (!details.empty()) out << details << "\n";
    }
    return out.str();
}

Expected<size_t> IndexGenerator::generate() const {
    auto entries = collect();
    if (!entries) return entries.error();

    auto written = writeFileAtomic(indexPath(), render(entries.value()));
    if (!written) return written.error();

    Logger::instance().debug("wrote " + std::to_string(entries.value().size()) + " entries to " +
                             indexPath().string());
    return entries.value().size();
}

}
