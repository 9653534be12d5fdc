#include "cli/commands/HashCommand.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "util/Logger.hpp"

namespace evidhash {

namespace {

Error invalidArgs(const std::string& msg) {
    return Error{ErrorCode::InvalidArgs, msg};
}

void printResults(const HashResultMap& results) {
    // Map keys are absolute paths, so iteration is already path-sorted
    for (const auto& [path, r] : results) {
        if (r.succeeded()) {
            std::cout << *r.hashValue << "  " << path << "\n";
        } else {
            std::cout << "FAILED  " << path << ": " << r.error->displayMessage() << "\n";
        }
    }
}

void printSummary(const HashOperationMetrics& m, HashAlgorithm algorithm) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << toString(algorithm) << ": " << (m.processedFiles - m.failedFiles) << " ok, " << m.failedFiles
       << " failed, " << m.totalFiles << " files, " << m.processedBytes << " bytes, " << m.durationSeconds()
       << " s, " << m.averageSpeedMbps() << " MB/s, " << m.threadCount
       << (m.threadCount == 1 ? " thread" : " threads");
    std::cout << os.str() << "\n";
}

}

Expected<HashCommandOptions> HashCommand::parseArgs(const std::vector<std::string>& args) {
    HashCommandOptions opts;
    bool endOfOptions = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (endOfOptions || a.empty() || a[0] != '-' || a == "-") {
            opts.paths.emplace_back(a);
            continue;
        }
        if (a == "--") {
            endOfOptions = true;
        } else if (a == "-a" || a == "--algorithm") {
            if (i + 1 >= args.size()) return invalidArgs(a + " requires a value");
            auto algo = parseHashAlgorithm(args[++i]);
            if (!algo) return invalidArgs("unsupported algorithm: " + args[i]);
            opts.algorithm = *algo;
        } else if (a == "-t" || a == "--threads") {
            if (i + 1 >= args.size()) return invalidArgs(a + " requires a value");
            const std::string& v = args[++i];
            size_t n = 0;
            try {
                size_t consumed = 0;
                n = std::stoul(v, &consumed);
                if (consumed != v.size()) return invalidArgs("not a number: " + v);
            } catch (const std::exception&) {
                return invalidArgs("not a number: " + v);
            }
            if (n < Constants::MIN_THREADS || n > Constants::MAX_THREADS) {
                return invalidArgs("--threads must be between " + std::to_string(Constants::MIN_THREADS) +
                                   " and " + std::to_string(Constants::MAX_THREADS));
            }
            opts.config.forcedThreads = n;
        } else if (a == "--no-detect") {
            opts.config.runStorageDetection = false;
        } else if (a == "-v" || a == "--verbose") {
            opts.verbose = true;
        } else if (a == "-q" || a == "--quiet") {
            opts.quiet = true;
        } else {
            return invalidArgs("unknown option: " + a);
        }
    }
    if (opts.verbose && opts.quiet) return invalidArgs("--verbose and --quiet are mutually exclusive");
    if (opts.paths.empty()) return invalidArgs("no input paths");
    return opts;
}

Expected<void> HashCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parseArgs(args);
    if (!parsed) return parsed.error();
    const HashCommandOptions& opts = parsed.value();

    if (opts.verbose) Logger::instance().setLevel(LogLevel::Debug);
    if (opts.quiet) Logger::instance().setLevel(LogLevel::Error);

    const std::atomic<bool>* interrupted = ctx.interrupted;
    Predicate cancel = [interrupted] { return interrupted && interrupted->load(); };
    ProgressCallback progress = [](int percent, const std::string& message) {
        Logger::instance().debug("[" + std::to_string(percent) + "%] " + message);
    };

    HashOrchestrator orchestrator(opts.config);
    auto result = orchestrator.hashFiles(opts.paths, opts.algorithm, progress, cancel);

    if (result) {
        printResults(result.value());
    } else if (const auto* partial = result.metadataAs<HashResultMap>("partial_results")) {
        printResults(*partial);
    }
    if (!opts.quiet) {
        if (const auto* metrics = result.metadataAs<HashOperationMetrics>("metrics")) {
            printSummary(*metrics, opts.algorithm);
        }
    }

    if (!result) return result.error();
    return {};
}

}
