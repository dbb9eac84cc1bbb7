#include "cli/FlagParser.hpp"

#include <algorithm>

namespace folio {

Expected<void> parseFlags(const std::string& command,
                          const std::vector<std::string>& args,
                          const std::vector<std::string>& allowed,
                          SiteConfig& config) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) != 0) {
            return Error{ErrorCode::InvalidArgs, command + ": unexpected argument '" + arg + "'"};
        }

        std::string name = arg;
        std::string value;
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        } else {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, command + ": " + name + " requires a value"};
            }
            value = args[++i];
        }

        if (std::find(allowed.begin(), allowed.end(), name) == allowed.end()) {
            return Error{ErrorCode::InvalidArgs, command + ": unknown option '" + name + "'"};
        }
        auto applied = config.applyFlag(name, value);
        if (!applied) return Error{ErrorCode::InvalidArgs, command + ": " + applied.error().message};
        if (!applied.value()) {
            return Error{ErrorCode::InternalError, command + ": option '" + name + "' has no setting"};
        }
    }
    return {};
}

}
