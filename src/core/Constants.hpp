#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

/**
 * @brief Tunables used throughout the hashing engine
 *
 * Centralizes magic numbers; anything a deployment may need to recalibrate
 * is also exposed through HashConfig or DetectorConfig.
 */
namespace evidhash {

namespace Constants {
    // Adaptive read buffer tiers (thresholds are decimal MB)
    constexpr uint64_t SMALL_FILE_THRESHOLD = 1'000'000;     // below: small buffer
    constexpr uint64_t MEDIUM_FILE_THRESHOLD = 100'000'000;  // below: medium buffer
    constexpr size_t SMALL_BUFFER = 256 * 1024;              // 256 KiB
    constexpr size_t MEDIUM_BUFFER = 2 * 1024 * 1024;        // 2 MiB
    constexpr size_t LARGE_BUFFER = 10 * 1024 * 1024;        // 10 MiB

    // Hex digest lengths
    constexpr size_t MD5_HEX_LENGTH = 32;
    constexpr size_t SHA1_HEX_LENGTH = 40;
    constexpr size_t SHA256_HEX_LENGTH = 64;

    // Worker pool bounds
    constexpr size_t MIN_THREADS = 1;
    constexpr size_t MAX_THREADS = 16;
    constexpr size_t QUEUE_DEPTH_PER_WORKER = 2;  // jobs queued ahead of each worker

    // Timing
    constexpr std::chrono::milliseconds SHUTDOWN_TIMEOUT{3000};
    constexpr std::chrono::milliseconds PROGRESS_INTERVAL{100};
    constexpr std::chrono::milliseconds PAUSE_POLL_INTERVAL{50};
    constexpr std::chrono::milliseconds SUBMIT_POLL_INTERVAL{50};

    // Storage detection
    constexpr size_t PROBE_BYTES = 10 * 1024 * 1024;          // performance test size
    constexpr float HARDWARE_CONFIDENCE = 0.9f;
    constexpr float INVENTORY_CONFIDENCE = 0.7f;
    constexpr float SHORT_CIRCUIT_CONFIDENCE = 0.8f;           // tier 1 NVMe accepted outright
    constexpr float ACCEPT_CONFIDENCE = 0.7f;                  // minimum to trust a tier
    constexpr double HDD_WRITE_CEILING_MBPS = 50.0;
    constexpr double NVME_WRITE_FLOOR_MBPS = 1000.0;
    constexpr double NVME_READ_FLOOR_MBPS = 1000.0;
    constexpr double SSD_WRITE_FLOOR_MBPS = 200.0;

    constexpr double BYTES_PER_MB = 1024.0 * 1024.0;
}
}
