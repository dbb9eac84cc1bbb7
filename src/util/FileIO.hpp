#pragma once

#include <filesystem>
#include <string>

#include "util/Expected.hpp"

namespace folio {

/// Read a whole file as bytes
Expected<std::string> readTextFile(const std::filesystem::path& path);

/**
 * @brief Write content next to the target, then rename over it
 *
 * Writes to `<path>.tmp` first so readers never observe a half-written file.
 * The parent directory must already exist. The temporary file is removed if
 * the write fails.
 */
Expected<void> writeFileAtomic(const std::filesystem::path& path, const std::string& content);

/// `<path>.tmp`, the staging name used for atomic writes
std::filesystem::path tempPathFor(const std::filesystem::path& path);

}
