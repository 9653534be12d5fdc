#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "core/StorageInfo.hpp"

namespace evidhash {

/// Tier 1 answer: what the device reports about itself
struct HardwareReport {
    std::optional<bool> seekPenalty;   // true for rotational media
    BusType busType{BusType::Unknown};
    bool removable{false};
    std::string deviceName;            // e.g. "nvme0n1", "sda"
};

/// Tier 3 answer: what the OS disk inventory says about the backing disk
struct MediaReport {
    std::optional<bool> rotational;
    bool network{false};
    bool removable{false};
    std::string fsType;
    std::string deviceName;
};

/**
 * @brief Platform capability for querying storage hardware
 *
 * Implementations return std::nullopt when the platform or device cannot
 * answer; the detector then falls through to a lower tier.
 */
class IHardwareStorageQuery {
public:
    virtual ~IHardwareStorageQuery() = default;

    /// Seek penalty and bus type for the device backing a volume
    virtual std::optional<HardwareReport> queryDevice(const std::filesystem::path& volume) = 0;

    /// Media type from the disk inventory for the device backing a volume
    virtual std::optional<MediaReport> queryMediaType(const std::filesystem::path& volume) = 0;

    virtual const char* platformName() const = 0;
};

/**
 * @brief Linux implementation over sysfs and /proc/self/mountinfo
 *
 * queryDevice:    st_dev -> /sys/dev/block/MAJ:MIN -> disk's queue/rotational,
 *                 removable flag, and bus inferred from the device's sysfs path.
 * queryMediaType: mountinfo entry for the volume -> source device name ->
 *                 /sys/class/block/<name> -> owning disk's queue/rotational;
 *                 network filesystems are flagged without touching sysfs.
 *
 * Both roots are configurable so tests can point them at a fake tree.
 */
class LinuxStorageQuery : public IHardwareStorageQuery {
public:
    explicit LinuxStorageQuery(std::filesystem::path sysRoot = "/sys",
                               std::filesystem::path procRoot = "/proc");

    std::optional<HardwareReport> queryDevice(const std::filesystem::path& volume) override;
    std::optional<MediaReport> queryMediaType(const std::filesystem::path& volume) override;
    const char* platformName() const override { return "linux"; }

    /// queryDevice for an explicit device number (st_dev split into major/minor)
    std::optional<HardwareReport> queryDeviceNumber(unsigned devMajor, unsigned devMinor);

    /// Bus type inferred from a canonical sysfs device path
    static BusType busTypeFromSysPath(const std::string& sysPath);

    /// True for filesystem types served over the network
    static bool isNetworkFsType(const std::string& fsType);

private:
    std::optional<std::filesystem::path> diskDirFor(const std::filesystem::path& blockDir) const;

    std::filesystem::path sysRoot;
    std::filesystem::path procRoot;
};

/// Used where no platform query exists; every query returns nullopt
class UnavailableStorageQuery : public IHardwareStorageQuery {
public:
    std::optional<HardwareReport> queryDevice(const std::filesystem::path&) override { return std::nullopt; }
    std::optional<MediaReport> queryMediaType(const std::filesystem::path&) override { return std::nullopt; }
    const char* platformName() const override { return "unavailable"; }
};

/// Query implementation for the platform this binary was built for
std::unique_ptr<IHardwareStorageQuery> createPlatformStorageQuery();

}
