#include "core/StorageInfo.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace evidhash {

const char* toString(DriveType type) {
    switch (type) {
        case DriveType::Unknown: return "Unknown";
        case DriveType::Hdd: return "HDD";
        case DriveType::Ssd: return "SSD";
        case DriveType::NVMe: return "NVMe";
        case DriveType::ExternalSsd: return "External SSD";
        case DriveType::ExternalHdd: return "External HDD";
        case DriveType::Network: return "Network";
    }
    return "Unknown";
}

const char* toString(BusType type) {
    switch (type) {
        case BusType::Unknown: return "UNKNOWN";
        case BusType::Scsi: return "SCSI";
        case BusType::Atapi: return "ATAPI";
        case BusType::Ata: return "ATA";
        case BusType::Ieee1394: return "IEEE1394";
        case BusType::Ssa: return "SSA";
        case BusType::FibreChannel: return "FIBRE_CHANNEL";
        case BusType::Usb: return "USB";
        case BusType::Raid: return "RAID";
        case BusType::Iscsi: return "ISCSI";
        case BusType::Sas: return "SAS";
        case BusType::Sata: return "SATA";
        case BusType::Sd: return "SD";
        case BusType::Mmc: return "MMC";
        case BusType::Virtual: return "VIRTUAL";
        case BusType::FileBackedVirtual: return "FILE_BACKED_VIRTUAL";
        case BusType::Spaces: return "SPACES";
        case BusType::NVMe: return "NVME";
        case BusType::Scm: return "SCM";
    }
    return "UNKNOWN";
}

uint8_t recommendedThreads(DriveType type) {
    switch (type) {
        case DriveType::NVMe: return 16;
        case DriveType::Ssd: return 8;
        case DriveType::ExternalSsd: return 4;
        case DriveType::Network: return 2;
        case DriveType::Hdd:
        case DriveType::ExternalHdd:
        case DriveType::Unknown:
            return 1;
    }
    return 1;
}

int performanceClass(DriveType type) {
    switch (type) {
        case DriveType::NVMe: return 5;
        case DriveType::Ssd: return 4;
        case DriveType::ExternalSsd: return 3;
        case DriveType::Hdd: return 2;
        case DriveType::ExternalHdd:
        case DriveType::Network:
        case DriveType::Unknown:
            return 1;
    }
    return 1;
}

StorageInfo StorageInfo::make(DriveType type, BusType bus, std::optional<bool> ssd, bool removable,
                              float conf, std::string method, std::string mount) {
    StorageInfo info;
    info.driveType = type;
    info.busType = bus;
    info.isSsd = ssd;
    info.isRemovable = removable;
    info.recommendedThreads = evidhash::recommendedThreads(type);
    info.confidence = conf;
    info.detectionMethod = std::move(method);
    info.mountPoint = std::move(mount);
    info.performanceClass = evidhash::performanceClass(type);
    return info;
}

StorageInfo StorageInfo::fallback(const std::string& mount, const std::string& reason) {
    return make(DriveType::Unknown, BusType::Unknown, std::nullopt, false, 0.0f,
                "conservative_fallback_" + reason, mount);
}

std::string StorageInfo::toString() const {
    std::ostringstream os;
    os << evidhash::toString(driveType) << " on " << (mountPoint.empty() ? "?" : mountPoint)
       << " [" << evidhash::toString(busType) << "] -> " << static_cast<int>(recommendedThreads)
       << (recommendedThreads == 1 ? " thread" : " threads")
       << " (confidence: " << static_cast<int>(std::lround(confidence * 100.0f)) << "%)";
    return os.str();
}

}
