#pragma once

#include <cstddef>
#include <filesystem>

#include "util/Expected.hpp"

namespace evidhash {

/// Sequential throughput measured on one volume
struct ProbeMeasurement {
    double writeMbps{0.0};
    double readMbps{0.0};
};

/**
 * @brief Measures write and read-back speed on a volume
 *
 * Separate from the detector so classification can be exercised with
 * simulated speeds.
 */
class IPerformanceProbe {
public:
    virtual ~IPerformanceProbe() = default;
    virtual Expected<ProbeMeasurement> measure(const std::filesystem::path& dir, size_t bytes) = 0;
};

/**
 * @brief Real probe: write random bytes, fsync, read them back
 *
 * The temporary file is removed on every exit path. If dir is not
 * writable the probe runs in the fallback directory (default: the system
 * temp directory), but only when it sits on the same device as dir;
 * otherwise measure() fails with DetectionFailed.
 */
class FilesystemPerformanceProbe : public IPerformanceProbe {
public:
    explicit FilesystemPerformanceProbe(std::filesystem::path fallbackDir = {});

    Expected<ProbeMeasurement> measure(const std::filesystem::path& dir, size_t bytes) override;

private:
    Expected<std::filesystem::path> sameDeviceFallback(const std::filesystem::path& dir) const;

    std::filesystem::path fallback;
};

}
