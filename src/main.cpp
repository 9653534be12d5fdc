// evidhash entry point: command dispatch plus SIGINT -> cooperative cancel.

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"

using namespace evidhash;

namespace {

std::atomic<bool> gInterrupted{false};

void onInterrupt(int) {
    // Second Ctrl-C falls back to the default handler and terminates
    if (gInterrupted.exchange(true)) std::signal(SIGINT, SIG_DFL);
}

}

int main(int argc, char** argv) {
    registerBuiltinCommands();
    std::signal(SIGINT, onInterrupt);

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    AppContext ctx{};
    ctx.interrupted = &gInterrupted;
    CommandInvoker invoker;

    if (args.empty() || args.front() == "-h" || args.front() == "--help") {
        auto cmd = CommandFactory::instance().create("help");
        return invoker.run(*cmd, ctx, {});
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        auto help = CommandFactory::instance().create("help");
        invoker.run(*help, ctx, {});
        return 1;
    }
    return invoker.run(*cmd, ctx, args);
}
