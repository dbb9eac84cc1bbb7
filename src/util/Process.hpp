#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace folio {

/// Outcome of a child process that ran to completion
struct ProcessResult {
    int exitStatus{0};        // exit code, or 128 + signal number if killed by a signal
    std::string stderrText;   // captured standard error, truncated
};

/**
 * @brief Run an external program and wait for it
 *
 * Forks and execs argv[0] (looked up on PATH). Standard input is /dev/null,
 * standard output is inherited, standard error is captured up to
 * Constants::MAX_CAPTURED_STDERR bytes.
 *
 * @param argv Program and arguments; must not be empty
 * @param timeout Wall-clock limit; zero means wait indefinitely
 * @return ProcessResult, or Timeout (child killed) / IoError (spawn failed)
 *
 * A non-zero exit status is not an error at this level.
 */
Expected<ProcessResult> runProcess(const std::vector<std::string>& argv,
                                   std::chrono::seconds timeout = std::chrono::seconds::zero());

}
