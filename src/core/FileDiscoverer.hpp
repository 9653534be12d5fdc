#pragma once

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace evidhash {

/// One discovered regular file and the path it is reported under
struct DiscoveredFile {
    std::filesystem::path path;          // absolute, normalized
    std::filesystem::path relativePath;  // relative to the input it came from
};

/**
 * @brief Expands input paths into a flat list of regular files
 *
 * - Regular files pass through (relative path = file name)
 * - Directories are walked to any depth (relative path = below that directory)
 * - Unreadable directories, vanished entries and broken symlinks are skipped
 *   and recorded in warnings(); discovery never fails as a whole
 * - Symlinked directories are not descended into
 * - Duplicates from overlapping inputs are dropped; first-seen order wins
 * - Entries within a directory are visited in name order
 */
class FileDiscoverer {
public:
    std::vector<DiscoveredFile> discoverEntries(const std::vector<std::filesystem::path>& inputs);

    /// Paths only, same order as discoverEntries()
    std::vector<std::filesystem::path> discover(const std::vector<std::filesystem::path>& inputs);

    /// Warnings recorded by the last discover call
    const std::vector<std::string>& warnings() const { return warningList; }

private:
    void scanDirectory(const std::filesystem::path& root, std::vector<DiscoveredFile>& out);
    void addFile(const std::filesystem::path& file, const std::filesystem::path& rel,
                 std::vector<DiscoveredFile>& out);
    void warn(const std::string& msg);

    std::vector<std::string> warningList;
    std::unordered_set<std::string> seenKeys;
};

}
