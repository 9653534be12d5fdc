#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"
#include "core/HashOrchestrator.hpp"
#include "util/IHasher.hpp"

namespace evidhash {

/// Options of `evidhash hash` after parsing
struct HashCommandOptions {
    HashAlgorithm algorithm{HashAlgorithm::Sha256};
    HashConfig config;
    std::vector<std::filesystem::path> paths;
    bool verbose{false};
    bool quiet{false};
};

class HashCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "hash"; }
    const char* description() const override { return "Hash files and directories"; }
    const char* helpNameLine() const override { return "hash -  Compute content digests of files"; }
    const char* helpSynopsis() const override {
        return "evidhash hash [--algorithm sha256|sha1|md5] [--threads <n>] [--no-detect] [--verbose|--quiet] <path>...";
    }
    const char* helpDescription() const override {
        return "Hash every regular file under the given paths in parallel. The worker count follows the "
               "detected storage type of each volume (the slowest volume wins) unless --threads is given. "
               "Prints '<digest>  <path>' per file sorted by path, then a summary line. Ctrl-C cancels "
               "and prints the files that completed.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"-a, --algorithm <name>", "sha256 (default), sha1 or md5."},
            {"-t, --threads <n>", "Use n workers and skip storage detection."},
            {"--no-detect", "Skip storage detection and hash with one worker."},
            {"-v, --verbose", "Debug logging."},
            {"-q, --quiet", "Errors only; no summary line."},
        };
    }

    /// Parse command-line arguments; InvalidArgs on unknown flags or missing values
    static Expected<HashCommandOptions> parseArgs(const std::vector<std::string>& args);
};

}
