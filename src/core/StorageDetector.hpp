#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "core/Constants.hpp"
#include "core/HardwareStorageQuery.hpp"
#include "core/PerformanceProbe.hpp"
#include "core/StorageInfo.hpp"

namespace evidhash {

/// Tier switches and recalibration points for storage detection
struct DetectorConfig {
    bool enableHardwareQuery{true};
    bool enablePerformanceTest{true};
    bool enableInventory{true};
    size_t probeBytes{Constants::PROBE_BYTES};
    double hddWriteCeilingMbps{Constants::HDD_WRITE_CEILING_MBPS};
    double nvmeWriteFloorMbps{Constants::NVME_WRITE_FLOOR_MBPS};
    double nvmeReadFloorMbps{Constants::NVME_READ_FLOOR_MBPS};
    double ssdWriteFloorMbps{Constants::SSD_WRITE_FLOOR_MBPS};
};

/**
 * @brief Classifies the storage behind a path and recommends a worker count
 *
 * Tiers, most trusted first:
 *   1. Hardware query (seek penalty + bus type), confidence 0.9
 *   2. Write/read performance probe, confidence 0.7-0.8
 *   3. OS inventory media type (rotational flag), confidence 0.7
 *
 * A tier 1 NVMe answer is returned immediately. A tier 2 NVMe answer
 * overrides a tier 1 generic SSD (NVMe behind a RAID/HBA controller).
 * When nothing is conclusive the result is Unknown with one thread.
 *
 * analyzePath() never throws.
 */
class StorageDetector {
public:
    explicit StorageDetector(DetectorConfig config = {},
                             std::unique_ptr<IHardwareStorageQuery> query = createPlatformStorageQuery(),
                             std::unique_ptr<IPerformanceProbe> probe = std::make_unique<FilesystemPerformanceProbe>());

    /**
     * @brief Analyze the volume containing path
     * @param sizeHint Bytes about to be read from this volume; 0 = unknown.
     *        A small batch shrinks the probe (never below 4 MiB).
     */
    StorageInfo analyzePath(const std::filesystem::path& path, uint64_t sizeHint = 0);

    /// Analyze /, /home, /mnt and /media (each distinct volume once)
    std::map<std::string, StorageInfo> analyzeAll();

    const DetectorConfig& config() const { return cfg; }

    // Tier classifiers, exposed for direct testing
    static std::optional<StorageInfo> classifyHardware(const HardwareReport& report, const std::string& mount);
    static StorageInfo classifyPerformance(const ProbeMeasurement& m, bool removable,
                                           const DetectorConfig& config, const std::string& mount);
    static std::optional<StorageInfo> classifyMedia(const MediaReport& report, const std::string& mount);

private:
    std::optional<StorageInfo> runHardwareTier(const std::filesystem::path& volume, bool& removable);
    std::optional<StorageInfo> runPerformanceTier(const std::filesystem::path& path, const std::string& mount,
                                                  bool removable, uint64_t sizeHint);
    std::optional<StorageInfo> runInventoryTier(const std::filesystem::path& volume);
    size_t probeSizeFor(uint64_t sizeHint) const;

    DetectorConfig cfg;
    std::unique_ptr<IHardwareStorageQuery> query;
    std::unique_ptr<IPerformanceProbe> probe;
};

}
