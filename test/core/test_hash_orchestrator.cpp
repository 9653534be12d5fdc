#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "test_utils.hpp"
#include "core/HashOrchestrator.hpp"
#include "core/storage_fakes.hpp"
#include "util/FileMetadata.hpp"

#include <unistd.h>

namespace fs = std::filesystem;

using namespace evidhash;
using namespace evidhash::test;
using namespace evidhash::test::utils;
using namespace std::chrono_literals;

class HashOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    /// Detector over fakes; the raw pointers stay valid while the orchestrator lives
    std::unique_ptr<StorageDetector> fakeDetector() {
        auto q = std::make_unique<FakeQuery>();
        auto p = std::make_unique<FakeProbe>();
        query = q.get();
        probe = p.get();
        return std::make_unique<StorageDetector>(DetectorConfig{}, std::move(q), std::move(p));
    }

    std::vector<fs::path> makeFiles(int count, const std::string& prefix = "f") {
        std::vector<fs::path> out;
        for (int i = 0; i < count; ++i) {
            out.push_back(createFile(tempDir, prefix + std::to_string(i) + ".bin",
                                     "content of file " + std::to_string(i)));
        }
        return out;
    }

    static const HashOperationMetrics& metricsOf(const Result<HashResultMap>& r) {
        const auto* m = r.metadataAs<HashOperationMetrics>("metrics");
        EXPECT_NE(m, nullptr);
        return *m;
    }

    fs::path tempDir;
    FakeQuery* query{nullptr};
    FakeProbe* probe{nullptr};
};

// Test: Empty input succeeds with an empty map and metrics attached
TEST_F(HashOrchestratorTest, EmptyInputSucceeds) {
    HashOrchestrator orchestrator;
    auto result = orchestrator.hashFiles({}, HashAlgorithm::Sha256);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().empty());
    const auto& m = metricsOf(result);
    EXPECT_EQ(m.totalFiles, 0u);
    EXPECT_TRUE(m.finalized());
}

// Test: An empty directory is also an empty, successful batch
TEST_F(HashOrchestratorTest, EmptyDirectorySucceeds) {
    fs::create_directories(tempDir / "nothing");
    HashOrchestrator orchestrator;
    auto result = orchestrator.hashFiles({tempDir / "nothing"}, HashAlgorithm::Md5);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().empty());
}

// Test: Every file gets a correct digest keyed by absolute path
TEST_F(HashOrchestratorTest, HashesEveryFile) {
    auto files = makeFiles(12);
    HashConfig cfg;
    cfg.forcedThreads = 4;
    HashOrchestrator orchestrator(cfg);

    auto result = orchestrator.hashFiles({tempDir}, HashAlgorithm::Sha256);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_EQ(result.value().size(), files.size());

    for (size_t i = 0; i < files.size(); ++i) {
        auto it = result.value().find(files[i].string());
        ASSERT_NE(it, result.value().end()) << files[i];
        ASSERT_TRUE(it->second.succeeded());
        EXPECT_EQ(*it->second.hashValue, sha256Hex("content of file " + std::to_string(i)));
        EXPECT_EQ(it->second.algorithm, HashAlgorithm::Sha256);
    }

    const auto& m = metricsOf(result);
    EXPECT_EQ(m.totalFiles, 12u);
    EXPECT_EQ(m.processedFiles, 12u);
    EXPECT_EQ(m.failedFiles, 0u);
    EXPECT_EQ(m.processedBytes, m.totalBytes);
    EXPECT_EQ(m.threadCount, 4u);
    EXPECT_TRUE(m.finalized());
    EXPECT_EQ(m.progressPercent(), 100);
}

// Test: Throughput is computed from wall-clock time, not summed per-file durations
TEST_F(HashOrchestratorTest, MetricsUseWallClockDuration) {
    makeFiles(16);
    HashConfig cfg;
    cfg.forcedThreads = 8;
    HashOrchestrator orchestrator(cfg);

    // Every pause poll costs 20ms, so each file takes tens of milliseconds
    Predicate slowPause = [] {
        std::this_thread::sleep_for(20ms);
        return false;
    };

    auto before = std::chrono::steady_clock::now();
    auto result = orchestrator.hashFiles({tempDir}, HashAlgorithm::Sha256, {}, {}, slowPause);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - before).count();

    ASSERT_TRUE(result.has_value());
    const auto& m = metricsOf(result);

    double summed = 0.0;
    for (const auto& [path, r] : result.value()) summed += r.duration;

    EXPECT_LE(m.durationSeconds(), elapsed);
    EXPECT_GT(summed, 2.0 * m.durationSeconds());
    EXPECT_NEAR(m.averageSpeedMbps(),
                (static_cast<double>(m.processedBytes) / Constants::BYTES_PER_MB) / m.durationSeconds(), 1e-9);
}

// Test: Cancelling after K completions returns Cancelled with exactly the finished files
TEST_F(HashOrchestratorTest, CancelAfterKFiles) {
    auto files = makeFiles(20);
    HashConfig cfg;
    cfg.forcedThreads = 1;
    cfg.progressInterval = 0ms;
    HashOrchestrator orchestrator(cfg);

    std::atomic<int> completed{0};
    ProgressCallback progress = [&completed](int, const std::string& msg) {
        if (msg.rfind("Hashed ", 0) == 0) ++completed;
    };
    Predicate cancel = [&completed] { return completed.load() >= 5; };

    auto result = orchestrator.hashFiles({tempDir}, HashAlgorithm::Sha256, progress, cancel);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);

    const auto* partial = result.metadataAs<HashResultMap>("partial_results");
    ASSERT_NE(partial, nullptr);
    EXPECT_GE(partial->size(), 5u);
    EXPECT_LT(partial->size(), files.size());
    for (const auto& [path, r] : *partial) {
        ASSERT_TRUE(r.succeeded()) << path;
        EXPECT_EQ(r.hashValue->size(), Constants::SHA256_HEX_LENGTH);
        EXPECT_EQ(*r.hashValue, sha256Hex(readFile(path)));
    }

    const auto& m = metricsOf(result);
    EXPECT_EQ(m.processedFiles, partial->size());
    EXPECT_EQ(m.totalFiles, files.size());
    EXPECT_TRUE(m.finalized());
}

// Test: Cancel before anything starts still attaches metrics
TEST_F(HashOrchestratorTest, CancelImmediately) {
    makeFiles(5);
    HashConfig cfg;
    cfg.forcedThreads = 2;
    HashOrchestrator orchestrator(cfg);

    auto result = orchestrator.hashFiles({tempDir}, HashAlgorithm::Md5, {}, [] { return true; });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    ASSERT_NE(result.metadataAs<HashResultMap>("partial_results"), nullptr);
    EXPECT_TRUE(result.metadataAs<HashResultMap>("partial_results")->empty());
    EXPECT_EQ(metricsOf(result).processedFiles, 0u);
}

// Test: A worker stuck in a paused file does not block past the shutdown timeout
TEST_F(HashOrchestratorTest, ShutdownTimeoutBoundsWait) {
    makeFiles(3);
    HashConfig cfg;
    cfg.forcedThreads = 1;
    cfg.shutdownTimeout = 100ms;
    HashOrchestrator orchestrator(cfg);

    // The pause hook blocks until released, ignoring cancellation, so the first file never finishes
    auto stuck = std::make_shared<std::atomic<bool>>(true);
    Predicate pause = [stuck] {
        while (stuck->load()) std::this_thread::sleep_for(5ms);
        return false;
    };
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    Predicate cancelFn = [cancel] { return cancel->load(); };

    std::thread trigger([cancel] {
        std::this_thread::sleep_for(50ms);
        cancel->store(true);
    });
    auto start = std::chrono::steady_clock::now();
    auto result = orchestrator.hashFiles({tempDir}, HashAlgorithm::Sha256, {}, cancelFn, pause);
    auto waited = std::chrono::steady_clock::now() - start;
    trigger.join();
    stuck->store(false);

    EXPECT_LT(waited, 2s);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    ASSERT_NE(result.metadataAs<HashResultMap>("partial_results"), nullptr);
    EXPECT_TRUE(result.metadataAs<HashResultMap>("partial_results")->empty());
    EXPECT_NE(result.metadataAs<HashOperationMetrics>("metrics"), nullptr);

    // Let the detached worker notice the abandonment before the files go away
    std::this_thread::sleep_for(50ms);
}

// Test: A cancel seen only by the workers still ends the batch as Cancelled
TEST_F(HashOrchestratorTest, CancelSeenOnlyByWorkersIsReported) {
    makeFiles(2);
    HashConfig cfg;
    cfg.forcedThreads = 1;
    HashOrchestrator orchestrator(cfg);

    // Cancel is raised between two polls of the drain loop; both files then stop before hashing
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    auto firstPause = std::make_shared<std::atomic<bool>>(true);
    Predicate pause = [cancel, firstPause] {
        if (firstPause->exchange(false)) {
            std::this_thread::sleep_for(120ms);
            cancel->store(true);
        }
        return false;
    };
    Predicate cancelFn = [cancel] { return cancel->load(); };

    std::mutex mtx;
    std::vector<std::string> messages;
    ProgressCallback progress = [&](int, const std::string& msg) {
        std::scoped_lock lock(mtx);
        messages.push_back(msg);
    };

    auto result = orchestrator.hashFiles({tempDir}, HashAlgorithm::Sha256, progress, cancelFn, pause);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    const auto* partial = result.metadataAs<HashResultMap>("partial_results");
    ASSERT_NE(partial, nullptr);
    EXPECT_TRUE(partial->empty());
    EXPECT_EQ(metricsOf(result).processedFiles, 0u);
    EXPECT_TRUE(metricsOf(result).finalized());
    for (const auto& msg : messages) {
        EXPECT_EQ(msg.rfind("Hashing complete", 0), std::string::npos) << msg;
    }
}

// Test: A slow progress callback does not hold the state the orchestrator polls
TEST_F(HashOrchestratorTest, ProgressCallbackRunsOutsideRunLock) {
    makeFiles(2);
    HashConfig cfg;
    cfg.forcedThreads = 1;
    cfg.progressInterval = 0ms;
    HashOrchestrator orchestrator(cfg);

    const auto callerThread = std::this_thread::get_id();
    std::atomic<bool> firstHashed{false};
    std::atomic<bool> inCallback{false};
    std::atomic<bool> polledMeanwhile{false};

    // The calling thread keeps polling cancel while it drains the pool
    Predicate cancelFn = [&] {
        if (inCallback.load() && std::this_thread::get_id() == callerThread) polledMeanwhile = true;
        return false;
    };
    ProgressCallback progress = [&](int, const std::string& msg) {
        if (msg.rfind("Hashed ", 0) != 0 || firstHashed.exchange(true)) return;
        inCallback = true;
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (!polledMeanwhile.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        inCallback = false;
    };

    auto result = orchestrator.hashFiles({tempDir}, HashAlgorithm::Sha256, progress, cancelFn);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().size(), 2u);
    EXPECT_TRUE(polledMeanwhile.load());
}

// Test: Files whose stat failed are left out of volume grouping
TEST(HashOrchestratorStaticTest, GroupByVolumeSkipsUnstatedFiles) {
    std::vector<DiscoveredFile> files = {
        {"/data/a.bin", "a.bin"},
        {"/data/gone.bin", "gone.bin"},
        {"/data/b.bin", "b.bin"},
        {"/other/c.bin", "c.bin"},
    };
    std::vector<uint64_t> sizes = {100, 0, 50, 7};
    std::vector<std::optional<uint64_t>> devices = {2049, std::nullopt, 2049, 64768};

    auto volumes = HashOrchestrator::groupByVolume(files, sizes, devices);
    ASSERT_EQ(volumes.size(), 2u);
    EXPECT_EQ(volumes.count(0), 0u);
    EXPECT_EQ(volumes.at(2049).sample, fs::path("/data/a.bin"));
    EXPECT_EQ(volumes.at(2049).bytes, 150u);
    EXPECT_EQ(volumes.at(2049).files, 2u);
    EXPECT_EQ(volumes.at(64768).files, 1u);

    std::vector<std::optional<uint64_t>> none(files.size());
    EXPECT_TRUE(HashOrchestrator::groupByVolume(files, sizes, none).empty());
}

// Test: Wall-clock duration includes storage detection
TEST_F(HashOrchestratorTest, DurationIncludesDetection) {
    makeFiles(4);
    auto q = std::make_unique<FakeQuery>();
    q->devicePerVolume = [](const fs::path&) -> std::optional<HardwareReport> {
        std::this_thread::sleep_for(150ms);
        return solidStateOn(BusType::NVMe);
    };
    auto det = std::make_unique<StorageDetector>(DetectorConfig{}, std::move(q), std::make_unique<FakeProbe>());
    HashOrchestrator orchestrator(HashConfig{}, std::move(det));

    auto result = orchestrator.hashFiles({tempDir}, HashAlgorithm::Sha256);
    ASSERT_TRUE(result.has_value());
    EXPECT_GE(metricsOf(result).durationSeconds(), 0.15);
}

// Test: Per-file failures are recorded without failing the batch
TEST_F(HashOrchestratorTest, PerFileFailureIsolated) {
    if (runningAsRoot()) GTEST_SKIP() << "root ignores file permissions";
    makeFiles(3);
    auto locked = createFile(tempDir, "locked.bin", "secret");
    fs::permissions(locked, fs::perms::none);

    HashConfig cfg;
    cfg.forcedThreads = 2;
    HashOrchestrator orchestrator(cfg);
    auto result = orchestrator.hashFiles({tempDir}, HashAlgorithm::Sha1);
    fs::permissions(locked, fs::perms::owner_all);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result.value().size(), 4u);
    const auto& failed = result.value().at(locked.string());
    EXPECT_FALSE(failed.succeeded());
    ASSERT_TRUE(failed.error.has_value());
    EXPECT_EQ(failed.error->code, ErrorCode::PermissionDenied);
    EXPECT_EQ(failed.fileSize, 6u);

    const auto& m = metricsOf(result);
    EXPECT_EQ(m.failedFiles, 1u);
    EXPECT_EQ(m.processedFiles, 4u);
    EXPECT_LT(m.processedBytes, m.totalBytes);
}

// Test: Progress starts at 0, never decreases and ends with the completion message
TEST_F(HashOrchestratorTest, ProgressIsMonotonic) {
    makeFiles(30);
    HashConfig cfg;
    cfg.forcedThreads = 6;
    cfg.progressInterval = 0ms;
    HashOrchestrator orchestrator(cfg);

    std::mutex mtx;
    std::vector<std::pair<int, std::string>> seen;
    ProgressCallback progress = [&](int p, const std::string& msg) {
        std::scoped_lock lock(mtx);
        seen.emplace_back(p, msg);
    };

    auto result = orchestrator.hashFiles({tempDir}, HashAlgorithm::Sha256, progress);
    ASSERT_TRUE(result.has_value());
    ASSERT_GE(seen.size(), 2u);
    EXPECT_EQ(seen.front().first, 0);
    for (size_t i = 1; i < seen.size(); ++i) {
        EXPECT_GE(seen[i].first, seen[i - 1].first) << "at " << i;
    }
    EXPECT_EQ(seen.back().first, 100);
    EXPECT_EQ(seen.back().second, "Hashing complete: 30 files");
}

// Test: Detection result sizes the pool, capped by maxThreads and file count
TEST_F(HashOrchestratorTest, DetectionSizesPool) {
    makeFiles(20);
    auto det = fakeDetector();
    query->device = solidStateOn(BusType::NVMe);
    HashOrchestrator orchestrator(HashConfig{}, std::move(det));

    auto result = orchestrator.hashFiles({tempDir}, HashAlgorithm::Sha256);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(metricsOf(result).threadCount, 16u);

    const auto* storage = result.metadataAs<std::vector<StorageInfo>>("storage");
    ASSERT_NE(storage, nullptr);
    ASSERT_EQ(storage->size(), 1u);
    EXPECT_EQ(storage->front().driveType, DriveType::NVMe);
    EXPECT_EQ(query->deviceCalls, 1);
}

// Test: maxThreads caps the detected recommendation
TEST_F(HashOrchestratorTest, MaxThreadsCap) {
    makeFiles(20);
    auto det = fakeDetector();
    query->device = solidStateOn(BusType::Sata);
    HashConfig cfg;
    cfg.maxThreads = 3;
    HashOrchestrator orchestrator(cfg, std::move(det));

    auto result = orchestrator.hashFiles({tempDir}, HashAlgorithm::Sha256);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(metricsOf(result).threadCount, 3u);
}

// Test: A slow-write volume hashes with a single worker
TEST_F(HashOrchestratorTest, HddVolumeUsesOneWorker) {
    makeFiles(10);
    auto det = fakeDetector();
    probe->measurement = ProbeMeasurement{14.0, 899.0};
    HashOrchestrator orchestrator(HashConfig{}, std::move(det));

    auto result = orchestrator.hashFiles({tempDir}, HashAlgorithm::Sha256);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(metricsOf(result).threadCount, 1u);
    EXPECT_GT(probe->lastBytes, 0u);
}

// Test: A single file uses one worker and skips detection
TEST_F(HashOrchestratorTest, SingleFileSkipsDetection) {
    auto files = makeFiles(1);
    auto det = fakeDetector();
    query->device = solidStateOn(BusType::NVMe);
    HashOrchestrator orchestrator(HashConfig{}, std::move(det));

    auto result = orchestrator.hashFiles(files, HashAlgorithm::Sha256);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(metricsOf(result).threadCount, 1u);
    EXPECT_EQ(query->deviceCalls, 0);
    EXPECT_EQ(result.value().at(files[0].string()).relativePath, fs::path("f0.bin"));
}

// Test: Forced thread count bypasses detection and never exceeds the file count
TEST_F(HashOrchestratorTest, ForcedThreadsBypassDetection) {
    makeFiles(3);
    auto det = fakeDetector();
    HashConfig cfg;
    cfg.forcedThreads = 8;
    HashOrchestrator orchestrator(cfg, std::move(det));

    auto result = orchestrator.hashFiles({tempDir}, HashAlgorithm::Sha256);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(metricsOf(result).threadCount, 3u);
    EXPECT_EQ(query->deviceCalls, 0);
    EXPECT_EQ(probe->calls, 0);
}

// Test: With detection disabled the pool is one worker
TEST_F(HashOrchestratorTest, DetectionDisabled) {
    makeFiles(4);
    HashConfig cfg;
    cfg.runStorageDetection = false;
    HashOrchestrator orchestrator(cfg);

    auto result = orchestrator.hashFiles({tempDir}, HashAlgorithm::Sha256);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(metricsOf(result).threadCount, 1u);
}

// Test: Inputs on two volumes use the smaller recommendation
TEST_F(HashOrchestratorTest, MultiVolumeUsesMinimum) {
    const fs::path shm = "/dev/shm";
    auto shmMeta = getFileMetadata(shm);
    auto tmpMeta = getFileMetadata(tempDir);
    if (!shmMeta || !tmpMeta || shmMeta.value().deviceId == tmpMeta.value().deviceId || ::access(shm.c_str(), W_OK) != 0) {
        GTEST_SKIP() << "needs a writable second volume at /dev/shm";
    }
    fs::path other = shm / tempDir.filename();
    makeFiles(4);
    createFile(other, "x.bin", "other volume");
    createFile(other, "y.bin", "other volume too");

    auto det = fakeDetector();
    const fs::path otherRoot = volumeRootOf(other);
    query->devicePerVolume = [otherRoot](const fs::path& volume) -> std::optional<HardwareReport> {
        if (volume == otherRoot) return rotatingOn(BusType::Sata);
        return solidStateOn(BusType::NVMe);
    };
    HashOrchestrator orchestrator(HashConfig{}, std::move(det));

    auto result = orchestrator.hashFiles({tempDir, other}, HashAlgorithm::Sha256);
    removeDir(other);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().size(), 6u);
    EXPECT_EQ(metricsOf(result).threadCount, 1u);
    const auto* storage = result.metadataAs<std::vector<StorageInfo>>("storage");
    ASSERT_NE(storage, nullptr);
    EXPECT_EQ(storage->size(), 2u);
}

// Test: Thread clamping rules
TEST(HashOrchestratorStaticTest, ClampThreads) {
    EXPECT_EQ(HashOrchestrator::clampThreads(16, 16, 100), 16u);
    EXPECT_EQ(HashOrchestrator::clampThreads(16, 4, 100), 4u);
    EXPECT_EQ(HashOrchestrator::clampThreads(8, 16, 3), 3u);
    EXPECT_EQ(HashOrchestrator::clampThreads(0, 16, 10), 1u);
    EXPECT_EQ(HashOrchestrator::clampThreads(4, 0, 10), 1u);
}
