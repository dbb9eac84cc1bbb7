#include "core/SiteConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <thread>

#include "core/Constants.hpp"

namespace fs = std::filesystem;

namespace folio {

static size_t defaultJobs() {
    return std::max<size_t>(std::thread::hardware_concurrency(), 1);
}

static const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && v[0] != '\0') ? v : nullptr;
}

Expected<size_t> parseCount(const std::string& text, const std::string& what) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        return Error{ErrorCode::InvalidArgs, what + ": expected a non-negative integer, got '" + text + "'"};
    }
    try {
        return static_cast<size_t>(std::stoull(text));
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgs, what + ": value out of range '" + text + "'"};
    }
}

SiteConfig SiteConfig::defaults() {
    SiteConfig c;
    c.contentRoot = Constants::DEFAULT_CONTENT_DIR;
    c.outputRoot = Constants::DEFAULT_OUTPUT_DIR;

    std::error_code ec;
    if (fs::is_regular_file(Constants::DEFAULT_TEMPLATE, ec)) c.templatePath = Constants::DEFAULT_TEMPLATE;
    if (fs::is_regular_file(Constants::DEFAULT_METADATA, ec)) c.metadataPath = Constants::DEFAULT_METADATA;

    c.pandocPath = Constants::DEFAULT_PANDOC;
    c.contentExtension = Constants::CONTENT_EXTENSION;
    c.outputExtension = Constants::OUTPUT_EXTENSION;
    c.maxDepth = 0;
    c.jobs = defaultJobs();
    c.timeout = std::chrono::seconds(0);

    c.indexSection = Constants::DEFAULT_INDEX_SECTION;
    c.indexFile = Constants::DEFAULT_INDEX_FILE;
    c.indexTitle = Constants::DEFAULT_INDEX_TITLE;

    c.serveHost = Constants::DEFAULT_SERVE_HOST;
    c.servePort = Constants::DEFAULT_SERVE_PORT;
    return c;
}

Expected<SiteConfig> SiteConfig::fromEnvironment() {
    SiteConfig c = defaults();
    if (const char* v = env("FOLIO_CONTENT")) c.contentRoot = v;
    if (const char* v = env("FOLIO_OUTPUT")) c.outputRoot = v;
    if (const char* v = env("FOLIO_TEMPLATE")) c.templatePath = v;
    if (const char* v = env("FOLIO_METADATA")) c.metadataPath = v;
    if (const char* v = env("FOLIO_PANDOC")) c.pandocPath = v;

    // Numeric settings go through the same validation as their flags
    const std::pair<const char*, const char*> numeric[] = {
        {"FOLIO_DEPTH", "--depth"},
        {"FOLIO_JOBS", "--jobs"},
        {"FOLIO_TIMEOUT", "--timeout"},
        {"FOLIO_PORT", "--port"},
    };
    for (const auto& [var, flag] : numeric) {
        const char* v = env(var);
        if (!v) continue;
        auto res = c.applyFlag(flag, v);
        if (!res) return Error{ErrorCode::ConfigError, std::string(var) + ": " + res.error().message};
    }
    return c;
}

Expected<bool> SiteConfig::applyFlag(const std::string& name, const std::string& value) {
    if (name == "--content") { contentRoot = value; return true; }
    if (name == "--output") { outputRoot = value; return true; }
    if (name == "--template") { templatePath = value; return true; }
    if (name == "--metadata") { metadataPath = value; return true; }
    if (name == "--pandoc") { pandocPath = value; return true; }
    if (name == "--section") { indexSection = value; return true; }
    if (name == "--file") { indexFile = value; return true; }
    if (name == "--title") { indexTitle = value; return true; }
    if (name == "--host") { serveHost = value; return true; }

    if (name == "--depth" || name == "--jobs" || name == "--timeout" || name == "--port") {
        auto n = parseCount(value, name);
        if (!n) return n.error();
        if (name == "--depth") {
            maxDepth = n.value();
        } else if (name == "--jobs") {
            if (n.value() == 0) return Error{ErrorCode::InvalidArgs, "--jobs: must be at least 1"};
            jobs = n.value();
        } else if (name == "--timeout") {
            timeout = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(n.value()));
        } else {
            if (n.value() == 0 || n.value() > std::numeric_limits<uint16_t>::max()) {
                return Error{ErrorCode::InvalidArgs, "--port: must be between 1 and 65535"};
            }
            servePort = static_cast<uint16_t>(n.value());
        }
        return true;
    }
    return false;
}

}
