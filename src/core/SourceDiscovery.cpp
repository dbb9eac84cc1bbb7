#include "core/SourceDiscovery.hpp"

#include <algorithm>

#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace folio {

static bool isExcluded(const fs::path& dir, const std::vector<fs::path>& excluded) {
    fs::path norm = dir.lexically_normal();
    return std::any_of(excluded.begin(), excluded.end(),
                       [&](const fs::path& e) { return e.lexically_normal() == norm; });
}

Expected<std::vector<fs::path>> discoverSources(const fs::path& root, const DiscoveryOptions& options) {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return Error{ErrorCode::ConfigError, "content root does not exist: " + root.string()};
    }
    if (!fs::is_directory(root, ec)) {
        return Error{ErrorCode::ConfigError, "content root is not a directory: " + root.string()};
    }

    fs::path absRoot = fs::absolute(root).lexically_normal();
    std::vector<fs::path> excluded;
    for (const auto& e : options.excluded) excluded.push_back(fs::absolute(e).lexically_normal());

    std::vector<fs::path> found;
    auto it = fs::recursive_directory_iterator(absRoot, fs::directory_options::none, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "cannot read " + root.string() + ": " + ec.message()};
    }

    std::error_code walkEc;
    for (; it != fs::recursive_directory_iterator(); it.increment(walkEc)) {
        const fs::directory_entry& entry = *it;
        const fs::path& p = entry.path();
        // depth() is 0 for direct children of root
        size_t depth = static_cast<size_t>(it.depth()) + 1;

        if (p.filename().string().rfind('.', 0) == 0) {
            if (entry.is_directory(ec)) it.disable_recursion_pending();
            continue;
        }
        if (entry.is_symlink(ec)) {
            Logger::instance().debug("skipping symlink " + p.string());
            continue;
        }
        if (entry.is_directory(ec)) {
            bool atLimit = options.maxDepth != 0 && depth >= options.maxDepth;
            if (atLimit || isExcluded(p, excluded)) it.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file(ec)) continue;
        if (options.maxDepth != 0 && depth > options.maxDepth) continue;
        if (p.extension().string() != options.extension) continue;

        found.push_back(p.lexically_relative(absRoot));
    }
    if (walkEc) {
        return Error{ErrorCode::IoError, "walking " + root.string() + " failed: " + walkEc.message()};
    }

    std::sort(found.begin(), found.end(), [](const fs::path& a, const fs::path& b) {
        return a.generic_string() < b.generic_string();
    });
    return found;
}

fs::path mapOutputPath(const fs::path& relative, const fs::path& outputRoot, const std::string& outputExtension) {
    fs::path out = outputRoot / relative;
    out.replace_extension(outputExtension);
    return out;
}

}
