#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>

#include "core/FileDiscoverer.hpp"
#include "core/HashTypes.hpp"
#include "util/Expected.hpp"
#include "util/IHasher.hpp"

namespace evidhash {

using Predicate = std::function<bool()>;

/**
 * @brief Hashes one file by streaming it through an adaptively sized buffer
 *
 * Buffer size follows file size: < 1 MB -> 256 KiB, < 100 MB -> 2 MiB,
 * otherwise 10 MiB. Before every chunk read the hasher blocks while the
 * pause predicate holds, then returns Cancelled if the cancel predicate
 * holds. A cancelled file yields no partial digest.
 *
 * Errors (all per-file): NotFound, PermissionDenied, IoError, Cancelled.
 *
 * Thread-safe: one instance may be shared by every worker.
 */
class StreamingHasher {
public:
    /// Called after each successful read with the byte count of that read
    using ChunkObserver = std::function<void(size_t bytes)>;

    struct Options {
        size_t bufferOverride{0};    // 0 = adaptive
        ChunkObserver onChunk;       // optional
    };

    StreamingHasher() = default;
    explicit StreamingHasher(Options options) : opts(std::move(options)) {}

    /// Adaptive buffer size for a file of the given size
    static size_t bufferSizeFor(uint64_t fileSize);

    /// Hash a file; relative path in the result is the file name
    Expected<HashResult> hashOne(const std::filesystem::path& filePath, HashAlgorithm algorithm,
                                 const Predicate& pause = {}, const Predicate& cancel = {}) const;

    /// Hash a discovered file, keeping its relative path
    Expected<HashResult> hashOne(const DiscoveredFile& file, HashAlgorithm algorithm,
                                 const Predicate& pause = {}, const Predicate& cancel = {}) const;

private:
    Options opts;
};

}
