#include "cli/CommandInvoker.hpp"

#include <iostream>

#include "util/Logger.hpp"

namespace evidhash {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = cmd.execute(ctx, args);
    if (!res) {
        const Error& err = res.error();
        Logger::instance().debug(std::string(cmd.name()) + ": " + toString(err.code) + ": " + err.message);
        std::cerr << "evidhash " << cmd.name() << ": " << err.displayMessage();
        if (!err.message.empty() && err.code != ErrorCode::Cancelled) std::cerr << " (" << err.message << ")";
        std::cerr << "\n";
        if (err.code == ErrorCode::InvalidArgs) std::cerr << "usage: " << cmd.helpSynopsis() << "\n";
        return res;
    }
    return {};
}

int CommandInvoker::run(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    return exitCodeFor(invoke(cmd, ctx, args));
}

int CommandInvoker::exitCodeFor(const Expected<void>& result) {
    return result ? 0 : 1;
}

}
