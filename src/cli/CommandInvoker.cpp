#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace folio {

Expected<void> CommandInvoker::invoke(ICommand& cmd, AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    Expected<void> res = Error{ErrorCode::InternalError, "command did not run"};
    try {
        res = cmd.execute(ctx, args);
    } catch (const std::exception& e) {
        res = Error{ErrorCode::InternalError, e.what()};
    }
    if (!res) {
        Logger::instance().debug(std::string(cmd.name()) + " failed with " + errorCodeName(res.error().code));
        Logger::instance().error(std::string(cmd.name()) + ": " + res.error().message);
        return res;
    }
    return {};
}

}
