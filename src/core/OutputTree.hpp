#pragma once

#include <cstdint>
#include <filesystem>

#include "util/Expected.hpp"

namespace folio {

/**
 * @brief Check that deleting outputRoot cannot touch source content
 *
 * Refuses the filesystem root, the current directory, the content root and
 * any ancestor of the content root.
 */
Expected<void> validateCleanTarget(const std::filesystem::path& outputRoot,
                                   const std::filesystem::path& contentRoot);

/**
 * @brief Delete the build output tree
 * @return Number of filesystem entries removed (0 if it did not exist),
 *         ConfigError if the target is unsafe or not a directory,
 *         IoError if removal fails
 */
Expected<std::uintmax_t> removeOutputTree(const std::filesystem::path& outputRoot,
                                          const std::filesystem::path& contentRoot);

}
