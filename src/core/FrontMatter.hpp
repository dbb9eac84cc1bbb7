#pragma once

#include <filesystem>
#include <map>
#include <string>

#include "util/Expected.hpp"

namespace folio {

/**
 * @brief Metadata block at the top of a content file
 *
 * On-disk format:
 *   ---
 *   title: Notes on Sheaves
 *   subtitle: "A first pass"
 *   date: 2024-06-15
 *   word_count: ~2400 words
 *   generate_toc: true
 *   ---
 *
 * Only the five recognized keys drive behaviour; any other key is kept in
 * `extra` untouched. Blank lines, `#` comments and indented continuation
 * lines inside the block are skipped.
 */
struct FrontMatter {
    std::string title;
    std::string subtitle;
    std::string date;        // YYYY-MM-DD, used for sorting listings
    std::string wordCount;   // free-text display string
    bool generateToc{false};
    bool present{false};     // a block was found in the file
    std::map<std::string, std::string> extra;

    /// Defaults for a content file: title is the file stem, everything else empty
    static FrontMatter defaultsFor(const std::filesystem::path& contentPath);
};

/**
 * @brief Parse the front-matter block at the very start of a document
 *
 * @param text Whole document text
 * @param defaults Values kept for every key the block does not set
 * @return Parsed metadata; defaults when no block is present;
 *         MetadataError when a block is present but malformed
 */
Expected<FrontMatter> parseFrontMatter(const std::string& text, const FrontMatter& defaults);

/// Interpret a boolean-like value (true/yes/on/1, case-insensitive)
bool parseFlag(const std::string& value);

/// True for a well-formed calendar date `YYYY-MM-DD`
bool isIsoDate(const std::string& value);

}
