#include "core/HashOrchestrator.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <system_error>

#include "util/FileMetadata.hpp"
#include "util/Logger.hpp"
#include "util/WorkerPool.hpp"

namespace fs = std::filesystem;

namespace evidhash {

namespace {

/**
 * State shared by the orchestrator and its tasks. Tasks hold it by
 * shared_ptr, so a worker detached after the shutdown timeout still
 * writes into live memory. Once abandoned is set (under mtx) no task
 * touches results, and once progress is closed nobody calls back into
 * the caller.
 */
struct RunState {
    RunState(ProgressCallback cb, std::chrono::milliseconds interval, StreamingHasher::Options opts,
             Predicate cancelFn, Predicate pauseFn)
        : progress(std::move(cb), interval), hasher(std::move(opts)),
          cancel(std::move(cancelFn)), pause(std::move(pauseFn)) {}

    std::mutex mtx;
    HashResultMap results;
    HashOperationMetrics metrics;
    ThrottledProgress progress;
    size_t cancelledFiles{0};  // files a worker stopped before finishing
    bool abandoned{false};

    const StreamingHasher hasher;
    const Predicate cancel;
    const Predicate pause;

    bool isAbandoned() {
        std::scoped_lock lock(mtx);
        return abandoned;
    }
    bool cancelRequested() { return isAbandoned() || (cancel && cancel()); }
    bool pauseRequested() { return !isAbandoned() && pause && pause(); }
};

void recordCompletion(RunState& state, const DiscoveredFile& file, HashAlgorithm algorithm, uint64_t statSize,
                      Expected<HashResult> outcome) {
    int percent = 0;
    std::string message;
    {
        std::scoped_lock lock(state.mtx);
        if (state.abandoned) return;
        if (!outcome && outcome.error().code == ErrorCode::Cancelled) {
            // Cancelled mid-file: no entry, no partial digest
            ++state.cancelledFiles;
            return;
        }

        HashResult result = outcome ? std::move(outcome.value())
                                    : HashResult::failure(file.path, file.relativePath, algorithm, statSize,
                                                          outcome.error());
        auto& m = state.metrics;
        ++m.processedFiles;
        if (result.succeeded()) {
            m.processedBytes = std::min(m.totalBytes, m.processedBytes + result.fileSize);
        } else {
            ++m.failedFiles;
            Logger::instance().warn("hash failed: " + file.path.string() + ": " + result.error->message);
        }
        m.currentFile = file.path.string();
        state.results.insert_or_assign(file.path.string(), std::move(result));
        percent = m.progressPercent();
        message = "Hashed " + file.relativePath.string();
    }

    // Outside mtx so a slow callback does not stall other workers;
    // ThrottledProgress drops values that arrive out of order
    state.progress.report(percent, message);
}

std::string summaryLine(const HashOperationMetrics& m) {
    std::ostringstream os;
    os.setf(std::ios::fixed);
    os.precision(2);
    os << m.processedFiles << "/" << m.totalFiles << " files, " << m.processedBytes << " bytes in "
       << m.durationSeconds() << "s (" << m.averageSpeedMbps() << " MB/s, " << m.threadCount << " threads)";
    return os.str();
}

}

HashOrchestrator::HashOrchestrator(HashConfig config, std::unique_ptr<StorageDetector> det)
    : cfg(config), detector(std::move(det)) {
    if (cfg.maxThreads == 0) cfg.maxThreads = Constants::MIN_THREADS;
}

size_t HashOrchestrator::clampThreads(size_t recommended, size_t maxThreads, size_t fileCount) {
    size_t n = std::clamp(recommended, Constants::MIN_THREADS, std::max(Constants::MIN_THREADS, maxThreads));
    if (fileCount > 0) n = std::min(n, fileCount);
    return n;
}

std::map<uint64_t, VolumeBatch> HashOrchestrator::groupByVolume(const std::vector<DiscoveredFile>& files,
                                                                const std::vector<uint64_t>& sizes,
                                                                const std::vector<std::optional<uint64_t>>& devices) {
    std::map<uint64_t, VolumeBatch> volumes;
    for (size_t i = 0; i < files.size(); ++i) {
        // No device means the stat failed; that file fails on its own later
        if (!devices[i]) continue;
        auto [it, inserted] = volumes.try_emplace(*devices[i], VolumeBatch{files[i].path, 0, 0});
        it->second.bytes += sizes[i];
        ++it->second.files;
    }
    return volumes;
}

size_t HashOrchestrator::choosePoolSize(const std::vector<DiscoveredFile>& files, const std::vector<uint64_t>& sizes,
                                        const std::vector<std::optional<uint64_t>>& devices,
                                        std::vector<StorageInfo>& storage) {
    if (cfg.forcedThreads > 0) {
        Logger::instance().info("using forced thread count " + std::to_string(cfg.forcedThreads));
        return clampThreads(cfg.forcedThreads, cfg.maxThreads, files.size());
    }
    if (files.size() == 1) {
        Logger::instance().debug("single file: one worker, storage detection skipped");
        return 1;
    }
    if (!cfg.runStorageDetection) {
        Logger::instance().info("storage detection disabled: one worker");
        return 1;
    }
    if (!detector) detector = std::make_unique<StorageDetector>();

    const auto volumes = groupByVolume(files, sizes, devices);
    if (volumes.empty()) {
        Logger::instance().info("no input could be stat'ed: one worker");
        return 1;
    }

    size_t threads = Constants::MAX_THREADS;
    for (const auto& [device, volume] : volumes) {
        StorageInfo info = detector->analyzePath(volume.sample, volume.bytes);
        threads = std::min<size_t>(threads, info.recommendedThreads);
        storage.push_back(std::move(info));
    }
    if (volumes.size() > 1) {
        Logger::instance().info("inputs span " + std::to_string(volumes.size()) +
                                " volumes; using the slowest recommendation (" + std::to_string(threads) + ")");
    }
    return clampThreads(threads, cfg.maxThreads, files.size());
}

Result<HashResultMap> HashOrchestrator::hashFiles(const std::vector<fs::path>& paths, HashAlgorithm algorithm,
                                                  ProgressCallback progress, Predicate cancel, Predicate pause) {
    FileDiscoverer discoverer;
    std::vector<DiscoveredFile> files = discoverer.discoverEntries(paths);

    StreamingHasher::Options hasherOpts;
    hasherOpts.bufferOverride = cfg.bufferOverride;
    auto state = std::make_shared<RunState>(std::move(progress), cfg.progressInterval, std::move(hasherOpts),
                                            std::move(cancel), std::move(pause));

    if (files.empty()) {
        Logger::instance().info("no files to hash");
        state->metrics.start(0, 0);
        state->metrics.finalize();
        state->progress.report(100, "Hashing complete: 0 files");
        auto result = Result<HashResultMap>::ok({});
        result.setMetadata("metrics", state->metrics);
        result.setMetadata("storage", std::vector<StorageInfo>{});
        return result;
    }

    {
        // Wall clock starts here, so detection time counts toward throughput
        std::scoped_lock lock(state->mtx);
        state->metrics.start(files.size(), 0);
    }

    // Stat once; a file that vanished is counted as 0 bytes and fails when hashed
    std::vector<uint64_t> sizes(files.size(), 0);
    std::vector<std::optional<uint64_t>> devices(files.size());
    uint64_t totalBytes = 0;
    for (size_t i = 0; i < files.size(); ++i) {
        auto meta = getFileMetadata(files[i].path);
        if (!meta) {
            Logger::instance().debug("stat failed before hashing: " + meta.error().message);
            continue;
        }
        sizes[i] = meta.value().sizeBytes;
        devices[i] = meta.value().deviceId;
        totalBytes += sizes[i];
    }

    std::vector<StorageInfo> storage;
    const size_t threads = choosePoolSize(files, sizes, devices, storage);

    {
        std::scoped_lock lock(state->mtx);
        state->metrics.totalBytes = totalBytes;
        state->metrics.threadCount = threads;
    }
    state->progress.report(0, "Hashing " + std::to_string(files.size()) + " files with " +
                                  std::to_string(threads) + (threads == 1 ? " thread" : " threads"));
    Logger::instance().info("hashing " + std::to_string(files.size()) + " files (" + std::to_string(totalBytes) +
                            " bytes) with " + std::to_string(threads) + " workers, " + toString(algorithm));

    auto finish = [&](Result<HashResultMap> result, bool attachPartial) {
        std::scoped_lock lock(state->mtx);
        state->metrics.finalize();
        result.setMetadata("metrics", state->metrics);
        result.setMetadata("storage", storage);
        if (attachPartial) result.setMetadata("partial_results", state->results);
        return result;
    };

    std::unique_ptr<WorkerPool> pool;
    try {
        pool = std::make_unique<WorkerPool>(threads);
    } catch (const std::system_error& e) {
        Logger::instance().error(std::string("cannot start worker pool: ") + e.what());
        return finish(Result<HashResultMap>::fail(Error{ErrorCode::InternalError,
                                                        std::string("worker pool creation failed: ") + e.what()}),
                      true);
    }

    const size_t queueLimit = threads * Constants::QUEUE_DEPTH_PER_WORKER;
    bool cancelled = false;

    for (size_t i = 0; i < files.size() && !cancelled; ++i) {
        while (!pool->waitForCapacity(queueLimit, Constants::SUBMIT_POLL_INTERVAL)) {
            if (state->cancelRequested()) break;
        }
        if (state->cancelRequested()) {
            cancelled = true;
            break;
        }

        const DiscoveredFile file = files[i];
        const uint64_t statSize = sizes[i];
        auto submitted = pool->submit([state, file, statSize, algorithm] {
            if (state->isAbandoned()) return;
            auto outcome = state->hasher.hashOne(file, algorithm,
                                                 [state] { return state->pauseRequested(); },
                                                 [state] { return state->cancelRequested(); });
            recordCompletion(*state, file, algorithm, statSize, std::move(outcome));
        });
        if (!submitted) {
            Logger::instance().error(submitted.error().message);
            {
                std::scoped_lock lock(state->mtx);
                state->abandoned = true;
            }
            pool->abandon();
            state->progress.close();
            return finish(Result<HashResultMap>::fail(submitted.error()), true);
        }
    }

    // Drain, still watching for cancellation
    while (!cancelled && !pool->waitFor(Constants::SUBMIT_POLL_INTERVAL)) {
        if (state->cancelRequested()) cancelled = true;
    }
    if (!cancelled) {
        // A cancel seen only by the workers leaves files unhashed after a clean drain
        std::scoped_lock lock(state->mtx);
        cancelled = state->cancelledFiles > 0;
    }

    if (cancelled) {
        size_t dropped = pool->discardPending();
        Logger::instance().info("cancellation requested; " + std::to_string(dropped) + " queued files dropped");
        if (!pool->waitFor(cfg.shutdownTimeout)) {
            Logger::instance().warn("workers did not stop within " + std::to_string(cfg.shutdownTimeout.count()) +
                                    " ms; returning partial results");
            {
                std::scoped_lock lock(state->mtx);
                state->abandoned = true;
            }
            pool->abandon();
        }
        state->progress.flushPending();
        state->progress.close();
        auto result = finish(Result<HashResultMap>::fail(Error{ErrorCode::Cancelled, "Hash operation cancelled"}),
                             true);
        Logger::instance().info("cancelled after " + summaryLine(*result.metadataAs<HashOperationMetrics>("metrics")));
        return result;
    }

    pool.reset();
    state->progress.flushPending();

    HashResultMap results;
    {
        std::scoped_lock lock(state->mtx);
        results = state->results;
    }
    state->progress.report(100, "Hashing complete: " + std::to_string(files.size()) + " files");
    state->progress.close();
    auto result = finish(Result<HashResultMap>::ok(std::move(results)), false);
    const auto* metrics = result.metadataAs<HashOperationMetrics>("metrics");
    if (metrics->failedFiles > 0 && metrics->failedFiles == metrics->totalFiles) {
        Logger::instance().warn("every file failed to hash");
    }
    Logger::instance().info("done: " + summaryLine(*metrics));
    return result;
}

}
