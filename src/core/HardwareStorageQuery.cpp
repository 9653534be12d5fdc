#include "core/HardwareStorageQuery.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>
#include <vector>

#include <sys/stat.h>
#include <sys/types.h>
#if defined(__linux__)
#include <sys/sysmacros.h>
#endif

#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace evidhash {

namespace {

std::optional<std::string> readFirstLine(const fs::path& file) {
    std::ifstream in(file);
    if (!in) return std::nullopt;
    std::string line;
    std::getline(in, line);
    while (!line.empty() && (line.back() == '\n' || line.back() == ' ' || line.back() == '\r')) line.pop_back();
    return line;
}

std::optional<bool> readFlag(const fs::path& file) {
    auto v = readFirstLine(file);
    if (!v || v->empty()) return std::nullopt;
    if (*v == "1") return true;
    if (*v == "0") return false;
    return std::nullopt;
}

// mountinfo escapes space, tab, newline and backslash as \ooo
std::string unescapeMountField(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 3 < s.size()) {
            const std::string oct = s.substr(i + 1, 3);
            if (std::all_of(oct.begin(), oct.end(), [](char c) { return c >= '0' && c <= '7'; })) {
                out.push_back(static_cast<char>(std::stoi(oct, nullptr, 8)));
                i += 3;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

struct MountEntry {
    fs::path mountPoint;
    std::string fsType;
    std::string source;
};

std::vector<MountEntry> readMountInfo(const fs::path& file) {
    std::vector<MountEntry> entries;
    std::ifstream in(file);
    if (!in) return entries;
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream ss(line);
        std::vector<std::string> fields;
        std::string f;
        while (ss >> f) fields.push_back(f);
        // id parent maj:min root mountpoint options [optional...] - fstype source superopts
        auto sep = std::find(fields.begin(), fields.end(), "-");
        if (fields.size() < 5 || sep == fields.end() || std::distance(sep, fields.end()) < 3) continue;
        MountEntry e;
        e.mountPoint = unescapeMountField(fields[4]);
        e.fsType = *(sep + 1);
        e.source = unescapeMountField(*(sep + 2));
        entries.push_back(std::move(e));
    }
    return entries;
}

bool isPathPrefix(const fs::path& prefix, const fs::path& p) {
    auto pit = p.begin();
    for (auto it = prefix.begin(); it != prefix.end(); ++it, ++pit) {
        if (it->empty()) continue;  // trailing separator
        if (pit == p.end() || *it != *pit) return false;
    }
    return true;
}

}

LinuxStorageQuery::LinuxStorageQuery(fs::path sys, fs::path proc)
    : sysRoot(std::move(sys)), procRoot(std::move(proc)) {}

BusType LinuxStorageQuery::busTypeFromSysPath(const std::string& sysPath) {
    // USB first: USB-attached NVMe and SATA bridges also show their bridge type
    if (sysPath.find("/usb") != std::string::npos) return BusType::Usb;
    if (sysPath.find("/nvme") != std::string::npos) return BusType::NVMe;
    if (sysPath.find("/mmc") != std::string::npos) return BusType::Mmc;
    if (sysPath.find("/ata") != std::string::npos) return BusType::Sata;
    if (sysPath.find("/virtio") != std::string::npos || sysPath.find("/virtual/") != std::string::npos) {
        return BusType::Virtual;
    }
    if (sysPath.find("/target") != std::string::npos) return BusType::Scsi;
    return BusType::Unknown;
}

bool LinuxStorageQuery::isNetworkFsType(const std::string& fsType) {
    static const std::array<const char*, 12> kNetworkTypes = {
        "nfs", "nfs4", "cifs", "smb3", "smbfs", "ncpfs", "afs", "9p",
        "ceph", "glusterfs", "fuse.sshfs", "davfs"
    };
    return std::any_of(kNetworkTypes.begin(), kNetworkTypes.end(),
                       [&](const char* t) { return fsType == t; });
}

std::optional<fs::path> LinuxStorageQuery::diskDirFor(const fs::path& blockDir) const {
    std::error_code ec;
    fs::path real = fs::canonical(blockDir, ec);
    if (ec) return std::nullopt;
    // A partition's parent directory is its disk
    if (fs::exists(real / "partition", ec)) return real.parent_path();
    return real;
}

std::optional<HardwareReport> LinuxStorageQuery::queryDevice(const fs::path& volume) {
    struct stat st;
    if (::stat(volume.c_str(), &st) != 0) {
        Logger::instance().debug("hardware query: cannot stat " + volume.string());
        return std::nullopt;
    }
    unsigned maj = ::major(st.st_dev);
    unsigned min = ::minor(st.st_dev);
    if (maj == 0) {
        // Anonymous device (tmpfs, overlay, btrfs subvolume): no sysfs node
        Logger::instance().debug("hardware query: " + volume.string() + " has no block device");
        return std::nullopt;
    }
    return queryDeviceNumber(maj, min);
}

std::optional<HardwareReport> LinuxStorageQuery::queryDeviceNumber(unsigned maj, unsigned min) {
    fs::path link = sysRoot / "dev" / "block" / (std::to_string(maj) + ":" + std::to_string(min));
    std::error_code ec;
    fs::path real = fs::canonical(link, ec);
    if (ec) {
        Logger::instance().debug("hardware query: no sysfs node " + link.string());
        return std::nullopt;
    }
    auto disk = diskDirFor(real);
    if (!disk) return std::nullopt;

    auto rotational = readFlag(*disk / "queue" / "rotational");
    if (!rotational) {
        Logger::instance().debug("hardware query: no rotational attribute under " + disk->string());
        return std::nullopt;
    }

    HardwareReport report;
    report.seekPenalty = *rotational;
    report.deviceName = disk->filename().string();
    report.removable = readFlag(*disk / "removable").value_or(false);
    report.busType = busTypeFromSysPath(real.string());
    if (report.busType == BusType::Unknown && report.deviceName.rfind("nvme", 0) == 0) {
        report.busType = BusType::NVMe;
    }
    if (report.busType == BusType::Usb) report.removable = true;
    return report;
}

std::optional<MediaReport> LinuxStorageQuery::queryMediaType(const fs::path& volume) {
    std::error_code ec;
    fs::path abs = fs::absolute(volume, ec).lexically_normal();
    auto mounts = readMountInfo(procRoot / "self" / "mountinfo");
    if (mounts.empty()) {
        Logger::instance().debug("inventory: mountinfo unavailable");
        return std::nullopt;
    }

    // Longest mount point containing the volume; later entries shadow earlier ones
    const MountEntry* best = nullptr;
    size_t bestDepth = 0;
    for (const auto& m : mounts) {
        if (!isPathPrefix(m.mountPoint, abs)) continue;
        size_t depth = static_cast<size_t>(std::distance(m.mountPoint.begin(), m.mountPoint.end()));
        if (!best || depth >= bestDepth) {
            best = &m;
            bestDepth = depth;
        }
    }
    if (!best) return std::nullopt;

    MediaReport report;
    report.fsType = best->fsType;
    if (isNetworkFsType(best->fsType)) {
        report.network = true;
        return report;
    }

    if (best->source.rfind("/dev/", 0) != 0) {
        Logger::instance().debug("inventory: mount source " + best->source + " is not a block device");
        return std::nullopt;
    }

    // /dev/mapper/x and /dev/disk/by-* are symlinks to the kernel name
    fs::path source = best->source;
    fs::path resolved = fs::canonical(source, ec);
    if (!ec) source = resolved;
    report.deviceName = source.filename().string();

    auto disk = diskDirFor(sysRoot / "class" / "block" / report.deviceName);
    if (!disk) return std::nullopt;
    report.rotational = readFlag(*disk / "queue" / "rotational");
    if (!report.rotational) return std::nullopt;
    report.removable = readFlag(*disk / "removable").value_or(false);
    report.deviceName = disk->filename().string();
    return report;
}

std::unique_ptr<IHardwareStorageQuery> createPlatformStorageQuery() {
#if defined(__linux__)
    return std::make_unique<LinuxStorageQuery>();
#else
    return std::make_unique<UnavailableStorageQuery>();
#endif
}

}
