#pragma once

#include "cli/ICommand.hpp"
#include "core/StorageInfo.hpp"

namespace evidhash {

class DetectCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "detect"; }
    const char* description() const override { return "Show detected storage type and thread count"; }
    const char* helpNameLine() const override { return "detect -  Classify the storage behind a path"; }
    const char* helpSynopsis() const override { return "evidhash detect [--all] [<path>]"; }
    const char* helpDescription() const override {
        return "Run storage detection for the volume containing <path> (default: current directory) and "
               "print the drive type, bus, recommended worker count and confidence. The performance tier "
               "writes and reads back a temporary file of up to 10 MiB.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"--all", "Analyze /, /home, /mnt and /media instead of one path."} };
    }

    /// Multi-line report for one volume
    static std::string describe(const StorageInfo& info);
};

}
