#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "core/Constants.hpp"
#include "core/FileDiscoverer.hpp"
#include "core/HashTypes.hpp"
#include "core/StorageDetector.hpp"
#include "core/StorageInfo.hpp"
#include "core/StreamingHasher.hpp"
#include "util/Expected.hpp"
#include "util/IHasher.hpp"
#include "util/ThrottledProgress.hpp"

namespace evidhash {

/// Call-time settings for a hashing run; defaults come from Constants
struct HashConfig {
    size_t forcedThreads{0};  // 0 = size the pool from storage detection
    size_t maxThreads{Constants::MAX_THREADS};
    std::chrono::milliseconds shutdownTimeout{Constants::SHUTDOWN_TIMEOUT};
    std::chrono::milliseconds progressInterval{Constants::PROGRESS_INTERVAL};
    bool runStorageDetection{true};
    size_t bufferOverride{0};  // 0 = adaptive buffer per file size
};

/// Inputs that share one st_dev; sample is the path handed to detection
struct VolumeBatch {
    std::filesystem::path sample;
    uint64_t bytes{0};
    size_t files{0};
};

/**
 * @brief Hashes a batch of files in parallel on a storage-sized worker pool
 *
 * Flow: discover -> stat -> detect storage once per volume -> hash on a
 * bounded pool -> aggregate results and wall-clock metrics.
 *
 * The returned Result always carries "metrics" (HashOperationMetrics) and
 * "storage" (std::vector<StorageInfo>, one per analyzed volume). On
 * cancellation it is a Cancelled error that also carries
 * "partial_results" (HashResultMap of the files that completed).
 *
 * Per-file failures never fail the call; they appear as failed entries.
 */
class HashOrchestrator {
public:
    explicit HashOrchestrator(HashConfig config = {}, std::unique_ptr<StorageDetector> detector = nullptr);

    Result<HashResultMap> hashFiles(const std::vector<std::filesystem::path>& paths,
                                    HashAlgorithm algorithm,
                                    ProgressCallback progress = {},
                                    Predicate cancel = {},
                                    Predicate pause = {});

    const HashConfig& config() const { return cfg; }

    /// Worker count for a batch: clamp(recommended, 1, maxThreads), never more than files
    static size_t clampThreads(size_t recommended, size_t maxThreads, size_t fileCount);

    /// Group stat'ed files by device, first file per device as sample; unset devices are skipped
    static std::map<uint64_t, VolumeBatch> groupByVolume(const std::vector<DiscoveredFile>& files,
                                                         const std::vector<uint64_t>& sizes,
                                                         const std::vector<std::optional<uint64_t>>& devices);

private:
    size_t choosePoolSize(const std::vector<DiscoveredFile>& files, const std::vector<uint64_t>& sizes,
                          const std::vector<std::optional<uint64_t>>& devices, std::vector<StorageInfo>& storage);

    HashConfig cfg;
    std::unique_ptr<StorageDetector> detector;
};

}
