#include "core/OutputTree.hpp"

namespace fs = std::filesystem;

namespace folio {

static fs::path resolved(const fs::path& p) {
    std::error_code ec;
    fs::path r = fs::weakly_canonical(fs::absolute(p), ec);
    return ec ? fs::absolute(p).lexically_normal() : r;
}

/// True if `inner` is `outer` or lies below it
static bool isWithin(const fs::path& inner, const fs::path& outer) {
    fs::path rel = inner.lexically_relative(outer);
    if (rel.empty()) return false;
    auto first = rel.begin();
    return first == rel.end() || *first != "..";
}

Expected<void> validateCleanTarget(const fs::path& outputRoot, const fs::path& contentRoot) {
    if (outputRoot.empty()) {
        return Error{ErrorCode::ConfigError, "output directory is not set"};
    }
    fs::path out = resolved(outputRoot);
    fs::path content = resolved(contentRoot);
    fs::path cwd = resolved(fs::current_path());

    if (out == out.root_path()) {
        return Error{ErrorCode::ConfigError, "refusing to clean filesystem root " + out.string()};
    }
    if (out == cwd) {
        return Error{ErrorCode::ConfigError, "refusing to clean the current directory"};
    }
    if (isWithin(content, out)) {
        return Error{ErrorCode::ConfigError,
                     "refusing to clean " + out.string() + ": it contains the content root " + content.string()};
    }
    return {};
}

Expected<std::uintmax_t> removeOutputTree(const fs::path& outputRoot, const fs::path& contentRoot) {
    auto safe = validateCleanTarget(outputRoot, contentRoot);
    if (!safe) return safe.error();

    std::error_code ec;
    auto st = fs::symlink_status(outputRoot, ec);
    if (ec || !fs::exists(st)) {
        return std::uintmax_t{0};
    }
    if (!fs::is_directory(st)) {
        return Error{ErrorCode::ConfigError, outputRoot.string() + " is not a directory"};
    }

    std::uintmax_t removed = fs::remove_all(outputRoot, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "failed to remove " + outputRoot.string() + ": " + ec.message()};
    }
    return removed;
}

}
