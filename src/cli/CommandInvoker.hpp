#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace folio {

/// Runs a command and reports its failure on the error log
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, AppContext& ctx, const std::vector<std::string>& args);
};

}
