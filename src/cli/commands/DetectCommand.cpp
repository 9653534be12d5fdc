#include "cli/commands/DetectCommand.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>

#include "core/StorageDetector.hpp"

namespace evidhash {

std::string DetectCommand::describe(const StorageInfo& info) {
    std::ostringstream os;
    os << info.toString() << "\n";
    os << "  method:            " << info.detectionMethod << "\n";
    os << "  ssd:               " << (info.isSsd ? (*info.isSsd ? "yes" : "no") : "unknown") << "\n";
    os << "  removable:         " << (info.isRemovable ? "yes" : "no") << "\n";
    os << "  performance class: " << info.performanceClass << "/5\n";
    return os.str();
}

Expected<void> DetectCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    bool all = false;
    std::filesystem::path target = ".";
    bool haveTarget = false;
    for (const auto& a : args) {
        if (a == "--all") {
            all = true;
        } else if (!a.empty() && a[0] == '-') {
            return Error{ErrorCode::InvalidArgs, "unknown option: " + a};
        } else if (haveTarget) {
            return Error{ErrorCode::InvalidArgs, "detect takes a single path"};
        } else {
            target = a;
            haveTarget = true;
        }
    }
    if (all && haveTarget) return Error{ErrorCode::InvalidArgs, "--all does not take a path"};

    StorageDetector detector;
    if (all) {
        for (const auto& [mount, info] : detector.analyzeAll()) {
            std::cout << mount << ":\n" << describe(info) << "\n";
        }
        return {};
    }

    std::error_code ec;
    if (!std::filesystem::exists(target, ec)) {
        return Error{ErrorCode::NotFound, "no such path: " + target.string(), "Path not found.", target.string()};
    }
    std::cout << describe(detector.analyzePath(target));
    return {};
}

}
