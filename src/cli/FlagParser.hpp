#pragma once

#include <string>
#include <vector>

#include "core/SiteConfig.hpp"
#include "util/Expected.hpp"

namespace folio {

/**
 * @brief Apply `--flag value` / `--flag=value` arguments to a config
 *
 * @param command Command name used in error messages
 * @param args Arguments after the command name
 * @param allowed Flags this command accepts (e.g., {"--output", "--port"})
 * @param config Updated in place
 * @return InvalidArgs for unknown flags, positional arguments, missing or
 *         malformed values
 */
Expected<void> parseFlags(const std::string& command,
                          const std::vector<std::string>& args,
                          const std::vector<std::string>& allowed,
                          SiteConfig& config);

}
