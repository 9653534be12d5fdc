#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "util/Expected.hpp"
#include "util/IHasher.hpp"

namespace evidhash {

/**
 * @brief Outcome of hashing one file
 *
 * Exactly one of hashValue / error is set. Build through success() or
 * failure() so the invariant cannot be broken; treat as immutable after.
 */
struct HashResult {
    std::filesystem::path filePath;
    std::filesystem::path relativePath;
    HashAlgorithm algorithm{HashAlgorithm::Sha256};
    std::optional<std::string> hashValue;  // lowercase hex
    uint64_t fileSize{0};
    double duration{0.0};                  // seconds, this file only
    std::optional<Error> error;

    static HashResult success(std::filesystem::path file, std::filesystem::path relative,
                              HashAlgorithm algo, std::string hex, uint64_t size, double seconds);
    static HashResult failure(std::filesystem::path file, std::filesystem::path relative,
                              HashAlgorithm algo, uint64_t size, Error err);

    bool succeeded() const { return hashValue.has_value() && !error.has_value(); }

    /// MiB/s for this file alone; 0 when size or duration is 0
    double speedMbps() const;
};

/// Results keyed by the file's absolute path string
using HashResultMap = std::map<std::string, HashResult>;

/**
 * @brief Wall-clock accounting for one hashing call
 *
 * Throughput is processedBytes over (endTime - startTime). Per-file
 * durations overlap when workers run in parallel and must not be summed.
 */
struct HashOperationMetrics {
    using Clock = std::chrono::steady_clock;

    Clock::time_point startTime{};
    std::optional<Clock::time_point> endTime;
    uint64_t totalFiles{0};
    uint64_t processedFiles{0};
    uint64_t totalBytes{0};
    uint64_t processedBytes{0};
    uint64_t failedFiles{0};
    std::string currentFile;
    size_t threadCount{0};   // workers actually used

    void start(uint64_t files, uint64_t bytes);

    /// Stamp endTime; later calls are ignored
    void finalize();

    bool finalized() const { return endTime.has_value(); }

    /// Elapsed seconds; live until finalize(), fixed afterward
    double durationSeconds() const;

    /// processedFiles / totalFiles as 0..100
    int progressPercent() const;

    /// MiB/s derived from wall-clock duration
    double averageSpeedMbps() const;
};

}
