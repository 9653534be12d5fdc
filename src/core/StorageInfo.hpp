#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace evidhash {

/// Storage classification; each type carries a recommended worker count
enum class DriveType { Unknown, Hdd, Ssd, NVMe, ExternalSsd, ExternalHdd, Network };

/// Connection interface, numbered like the Windows STORAGE_BUS_TYPE values
enum class BusType {
    Unknown = 0,
    Scsi = 1,
    Atapi = 2,
    Ata = 3,
    Ieee1394 = 4,
    Ssa = 5,
    FibreChannel = 6,
    Usb = 7,
    Raid = 8,
    Iscsi = 9,
    Sas = 10,
    Sata = 11,
    Sd = 12,
    Mmc = 13,
    Virtual = 14,
    FileBackedVirtual = 15,
    Spaces = 16,
    NVMe = 17,
    Scm = 18
};

const char* toString(DriveType type);
const char* toString(BusType type);

/// NVMe 16, SSD 8, external SSD 4, network 2, everything else 1
uint8_t recommendedThreads(DriveType type);

/// Expected throughput tier, 1 (slowest) to 5 (fastest)
int performanceClass(DriveType type);

/**
 * @brief Result of analyzing the device behind one volume
 *
 * Computed once per volume per hashing call and discarded afterward.
 */
struct StorageInfo {
    DriveType driveType{DriveType::Unknown};
    BusType busType{BusType::Unknown};
    std::optional<bool> isSsd;          // unset when the tier could not tell
    bool isRemovable{false};
    uint8_t recommendedThreads{1};      // always >= 1
    float confidence{0.0f};             // 0..1
    std::string detectionMethod;        // tier and outcome, for logs
    std::string mountPoint;             // volume root the info applies to
    int performanceClass{1};

    /// Build an info whose thread count and class follow from the drive type
    static StorageInfo make(DriveType type, BusType bus, std::optional<bool> ssd, bool removable,
                            float confidence, std::string method, std::string mount);

    /// Unknown/1-thread result used when nothing conclusive was found
    static StorageInfo fallback(const std::string& mount, const std::string& reason);

    /// e.g. "NVMe on / [NVME] -> 16 threads (confidence: 90%)"
    std::string toString() const;
};

}
