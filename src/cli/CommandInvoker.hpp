#pragma once

#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace evidhash {

/**
 * @brief Runs a command and turns its outcome into a process exit code
 *
 * Failures are logged with the technical message and printed to stderr
 * with the user-facing one. Exit codes: 0 success, 1 any error
 * (invalid arguments, cancellation, fatal failure).
 */
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);

    /// invoke() and map the result to an exit code
    int run(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);

    static int exitCodeFor(const Expected<void>& result);
};

}
