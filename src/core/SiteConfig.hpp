#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace folio {

/**
 * @brief Site-wide settings, resolved once at startup
 *
 * Precedence: built-in defaults, then FOLIO_* environment variables, then
 * command-line flags applied by each command.
 *
 * Environment:
 *   FOLIO_CONTENT   content root              (default: content)
 *   FOLIO_OUTPUT    build output root         (default: public)
 *   FOLIO_TEMPLATE  pandoc HTML template      (default: templates/default.html if present)
 *   FOLIO_METADATA  shared metadata file      (default: metadata.yaml if present)
 *   FOLIO_PANDOC    converter executable      (default: pandoc)
 *   FOLIO_DEPTH     discovery depth, 0 = any  (default: 0)
 *   FOLIO_JOBS      parallel conversions      (default: hardware threads)
 *   FOLIO_TIMEOUT   per-file seconds, 0 = none (default: 0)
 *   FOLIO_PORT      preview server port       (default: 8000)
 */
struct SiteConfig {
    std::filesystem::path contentRoot;
    std::filesystem::path outputRoot;
    std::filesystem::path templatePath;
    std::filesystem::path metadataPath;
    std::string pandocPath;
    std::string contentExtension;
    std::string outputExtension;
    size_t maxDepth{0};
    size_t jobs{1};
    std::chrono::seconds timeout{0};

    std::string indexSection;
    std::string indexFile;
    std::string indexTitle;

    std::string serveHost;
    uint16_t servePort{0};

    /// Built-in defaults only
    static SiteConfig defaults();

    /// Defaults overridden by FOLIO_* variables; ConfigError on malformed numbers
    static Expected<SiteConfig> fromEnvironment();

    /**
     * @brief Apply one `--name value` flag
     * @return true if the flag was recognized, false if not; InvalidArgs on a bad value
     */
    Expected<bool> applyFlag(const std::string& name, const std::string& value);
};

/// Parse a non-negative decimal integer; `what` names the setting in errors
Expected<size_t> parseCount(const std::string& text, const std::string& what);

}
