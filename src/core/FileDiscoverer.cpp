#include "core/FileDiscoverer.hpp"

#include <algorithm>
#include <stack>
#include <system_error>

#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace evidhash {

namespace {
fs::path normalizedAbsolute(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) abs = p;
    return abs.lexically_normal();
}
}

void FileDiscoverer::warn(const std::string& msg) {
    warningList.push_back(msg);
    Logger::instance().warn(msg);
}

void FileDiscoverer::addFile(const fs::path& file, const fs::path& rel, std::vector<DiscoveredFile>& out) {
    if (!seenKeys.insert(file.string()).second) {
        Logger::instance().debug("discover: duplicate skipped " + file.string());
        return;
    }
    out.push_back(DiscoveredFile{file, rel});
}

std::vector<DiscoveredFile> FileDiscoverer::discoverEntries(const std::vector<fs::path>& inputs) {
    warningList.clear();
    seenKeys.clear();
    std::vector<DiscoveredFile> out;

    for (const auto& input : inputs) {
        fs::path abs = normalizedAbsolute(input);
        std::error_code ec;
        fs::file_status st = fs::status(abs, ec);
        if (ec || !fs::exists(st)) {
            fs::file_status lst = fs::symlink_status(abs, ec);
            if (!ec && fs::is_symlink(lst)) {
                warn("discover: broken symlink skipped: " + abs.string());
            } else {
                warn("discover: path does not exist: " + abs.string());
            }
            continue;
        }

        if (fs::is_regular_file(st)) {
            addFile(abs, abs.filename(), out);
        } else if (fs::is_directory(st)) {
            scanDirectory(abs, out);
        } else {
            warn("discover: not a regular file or directory: " + abs.string());
        }
    }

    Logger::instance().debug("discover: " + std::to_string(out.size()) + " files, " +
                             std::to_string(warningList.size()) + " warnings");
    return out;
}

std::vector<fs::path> FileDiscoverer::discover(const std::vector<fs::path>& inputs) {
    std::vector<fs::path> paths;
    for (auto& entry : discoverEntries(inputs)) paths.push_back(std::move(entry.path));
    return paths;
}

void FileDiscoverer::scanDirectory(const fs::path& root, std::vector<DiscoveredFile>& out) {
    std::stack<fs::path> dirs;
    dirs.push(root);

    while (!dirs.empty()) {
        fs::path dir = dirs.top();
        dirs.pop();

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            warn("discover: cannot read directory " + dir.string() + ": " + ec.message());
            continue;
        }

        std::vector<fs::directory_entry> entries;
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                warn("discover: error while listing " + dir.string() + ": " + ec.message());
                break;
            }
            entries.push_back(*it);
        }
        std::sort(entries.begin(), entries.end(),
                  [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });

        std::vector<fs::path> subdirs;
        for (const auto& entry : entries) {
            const fs::path& p = entry.path();
            std::error_code sec;
            fs::file_status lst = entry.symlink_status(sec);
            if (sec) {
                warn("discover: cannot stat " + p.string() + ": " + sec.message());
                continue;
            }

            if (fs::is_symlink(lst)) {
                fs::file_status target = fs::status(p, sec);
                if (sec || !fs::exists(target)) {
                    warn("discover: broken symlink skipped: " + p.string());
                } else if (fs::is_regular_file(target)) {
                    addFile(p.lexically_normal(), p.lexically_relative(root), out);
                } else {
                    Logger::instance().debug("discover: not following symlink " + p.string());
                }
                continue;
            }

            if (fs::is_directory(lst)) {
                subdirs.push_back(p);
            } else if (fs::is_regular_file(lst)) {
                addFile(p.lexically_normal(), p.lexically_relative(root), out);
            }
        }

        // Reverse push keeps subdirectories in name order when popped
        for (auto sit = subdirs.rbegin(); sit != subdirs.rend(); ++sit) dirs.push(*sit);
    }
}

}
