#include "core/StorageDetector.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <set>
#include <system_error>

#include "util/FileMetadata.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace evidhash {

namespace {

constexpr size_t MIN_PROBE_BYTES = 4 * 1024 * 1024;
constexpr float INVENTORY_ACCEPT_CONFIDENCE = 0.6f;

}

StorageDetector::StorageDetector(DetectorConfig config,
                                 std::unique_ptr<IHardwareStorageQuery> q,
                                 std::unique_ptr<IPerformanceProbe> p)
    : cfg(config), query(std::move(q)), probe(std::move(p)) {
    if (!query) query = std::make_unique<UnavailableStorageQuery>();
}

std::optional<StorageInfo> StorageDetector::classifyHardware(const HardwareReport& report,
                                                             const std::string& mount) {
    if (!report.seekPenalty) return std::nullopt;
    const float conf = Constants::HARDWARE_CONFIDENCE;
    const bool removable = report.removable || report.busType == BusType::Usb;

    if (*report.seekPenalty) {
        DriveType type = removable ? DriveType::ExternalHdd : DriveType::Hdd;
        return StorageInfo::make(type, report.busType, false, removable, conf, "hardware_seek_penalty", mount);
    }
    if (report.busType == BusType::NVMe && !removable) {
        return StorageInfo::make(DriveType::NVMe, report.busType, true, false, conf, "hardware_bus_nvme", mount);
    }
    if (removable) {
        return StorageInfo::make(DriveType::ExternalSsd, report.busType, true, true, conf,
                                 "hardware_bus_removable", mount);
    }
    // RAID and every other bus: a generic SSD the probe may still upgrade
    return StorageInfo::make(DriveType::Ssd, report.busType, true, false, conf, "hardware_no_seek_penalty", mount);
}

StorageInfo StorageDetector::classifyPerformance(const ProbeMeasurement& m, bool removable,
                                                 const DetectorConfig& config, const std::string& mount) {
    // Write speed first: cached read-back makes slow disks look fast on read
    if (m.writeMbps < config.hddWriteCeilingMbps) {
        return StorageInfo::make(removable ? DriveType::ExternalHdd : DriveType::Hdd,
                                 removable ? BusType::Usb : BusType::Sata, false, removable, 0.8f,
                                 "performance_slow_write", mount);
    }
    if (m.writeMbps > config.nvmeWriteFloorMbps && m.readMbps > config.nvmeReadFloorMbps) {
        if (removable) {
            return StorageInfo::make(DriveType::ExternalSsd, BusType::Usb, true, true, 0.7f,
                                     "performance_fast_removable", mount);
        }
        return StorageInfo::make(DriveType::NVMe, BusType::NVMe, true, false, 0.8f, "performance_nvme", mount);
    }
    if (m.writeMbps > config.ssdWriteFloorMbps) {
        if (removable) {
            return StorageInfo::make(DriveType::ExternalSsd, BusType::Usb, true, true, 0.7f,
                                     "performance_fast_removable", mount);
        }
        return StorageInfo::make(DriveType::Ssd, BusType::Sata, true, false, 0.75f, "performance_ssd", mount);
    }
    return StorageInfo::make(DriveType::ExternalSsd, removable ? BusType::Usb : BusType::Unknown, true, removable,
                             0.7f, "performance_moderate", mount);
}

std::optional<StorageInfo> StorageDetector::classifyMedia(const MediaReport& report, const std::string& mount) {
    const float conf = Constants::INVENTORY_CONFIDENCE;
    if (report.network) {
        return StorageInfo::make(DriveType::Network, BusType::Unknown, std::nullopt, false, conf,
                                 "inventory_network_" + report.fsType, mount);
    }
    if (!report.rotational) return std::nullopt;
    if (*report.rotational) {
        return StorageInfo::make(report.removable ? DriveType::ExternalHdd : DriveType::Hdd, BusType::Unknown,
                                 false, report.removable, conf, "inventory_rotational", mount);
    }
    return StorageInfo::make(report.removable ? DriveType::ExternalSsd : DriveType::Ssd, BusType::Unknown,
                             true, report.removable, conf, "inventory_non_rotational", mount);
}

size_t StorageDetector::probeSizeFor(uint64_t sizeHint) const {
    if (sizeHint == 0 || cfg.probeBytes <= MIN_PROBE_BYTES) return cfg.probeBytes;
    return static_cast<size_t>(std::clamp<uint64_t>(sizeHint, MIN_PROBE_BYTES, cfg.probeBytes));
}

std::optional<StorageInfo> StorageDetector::runHardwareTier(const fs::path& volume, bool& removable) {
    if (!cfg.enableHardwareQuery) return std::nullopt;
    try {
        auto report = query->queryDevice(volume);
        if (!report) {
            Logger::instance().debug("tier 1 (" + std::string(query->platformName()) + "): no answer for " +
                                     volume.string());
            return std::nullopt;
        }
        removable = report->removable || report->busType == BusType::Usb;
        auto info = classifyHardware(*report, volume.string());
        if (info) Logger::instance().debug("tier 1: " + info->toString());
        return info;
    } catch (const std::exception& e) {
        Logger::instance().warn("tier 1 failed for " + volume.string() + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<StorageInfo> StorageDetector::runPerformanceTier(const fs::path& path, const std::string& mount,
                                                               bool removable, uint64_t sizeHint) {
    if (!cfg.enablePerformanceTest || !probe) return std::nullopt;
    try {
        auto measured = probe->measure(path, probeSizeFor(sizeHint));
        if (!measured) {
            Logger::instance().debug("tier 2: " + measured.error().message);
            return std::nullopt;
        }
        auto info = classifyPerformance(measured.value(), removable, cfg, mount);
        Logger::instance().debug("tier 2: " + info.toString());
        return info;
    } catch (const std::exception& e) {
        Logger::instance().warn("tier 2 failed for " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<StorageInfo> StorageDetector::runInventoryTier(const fs::path& volume) {
    if (!cfg.enableInventory) return std::nullopt;
    try {
        auto report = query->queryMediaType(volume);
        if (!report) return std::nullopt;
        auto info = classifyMedia(*report, volume.string());
        if (info) Logger::instance().debug("tier 3: " + info->toString());
        return info;
    } catch (const std::exception& e) {
        Logger::instance().warn("tier 3 failed for " + volume.string() + ": " + e.what());
        return std::nullopt;
    }
}

StorageInfo StorageDetector::analyzePath(const fs::path& path, uint64_t sizeHint) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        Logger::instance().warn("storage detection: path does not exist: " + path.string());
        return StorageInfo::fallback("", "path_not_found");
    }

    const fs::path volume = volumeRootOf(path);
    const std::string mount = volume.string();
    Logger::instance().debug("analyzing storage for " + path.string() + " (volume " + mount + ")");

    bool removable = false;
    auto hw = runHardwareTier(volume, removable);
    if (hw && hw->driveType == DriveType::NVMe && hw->confidence >= Constants::SHORT_CIRCUIT_CONFIDENCE) {
        Logger::instance().info("storage: " + hw->toString());
        return *hw;
    }

    fs::path probeDir = fs::is_directory(path, ec) ? path : path.parent_path();
    auto perf = runPerformanceTier(probeDir, mount, removable, sizeHint);
    if (perf && perf->confidence >= Constants::ACCEPT_CONFIDENCE) {
        if (perf->driveType == DriveType::NVMe && hw && hw->driveType == DriveType::Ssd) {
            perf->detectionMethod += "_override";
            Logger::instance().info("storage (NVMe override): " + perf->toString());
            return *perf;
        }
        if (!hw || hw->confidence < Constants::ACCEPT_CONFIDENCE) {
            Logger::instance().info("storage: " + perf->toString());
            return *perf;
        }
    }

    if (hw && hw->confidence >= Constants::SHORT_CIRCUIT_CONFIDENCE) {
        Logger::instance().info("storage: " + hw->toString());
        return *hw;
    }

    if (!removable) {
        auto inv = runInventoryTier(volume);
        if (inv && inv->confidence >= INVENTORY_ACCEPT_CONFIDENCE) {
            Logger::instance().info("storage: " + inv->toString());
            return *inv;
        }
    }

    Logger::instance().warn("storage detection inconclusive for " + mount + ", using one thread");
    return StorageInfo::fallback(mount, "all_methods_failed");
}

std::map<std::string, StorageInfo> StorageDetector::analyzeAll() {
    static const std::array<const char*, 4> kCommonMounts = {"/", "/home", "/mnt", "/media"};
    std::map<std::string, StorageInfo> out;
    std::set<uint64_t> seenDevices;
    for (const char* mount : kCommonMounts) {
        auto meta = getFileMetadata(mount);
        if (!meta) continue;
        if (!seenDevices.insert(meta.value().deviceId).second) continue;
        out.emplace(mount, analyzePath(mount));
    }
    return out;
}

}
