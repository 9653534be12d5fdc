#include "core/HashTypes.hpp"

#include <utility>

#include "core/Constants.hpp"

namespace evidhash {

HashResult HashResult::success(std::filesystem::path file, std::filesystem::path relative,
                               HashAlgorithm algo, std::string hex, uint64_t size, double seconds) {
    HashResult r;
    r.filePath = std::move(file);
    r.relativePath = std::move(relative);
    r.algorithm = algo;
    r.hashValue = std::move(hex);
    r.fileSize = size;
    r.duration = seconds;
    return r;
}

HashResult HashResult::failure(std::filesystem::path file, std::filesystem::path relative,
                               HashAlgorithm algo, uint64_t size, Error err) {
    HashResult r;
    r.filePath = std::move(file);
    r.relativePath = std::move(relative);
    r.algorithm = algo;
    r.fileSize = size;
    r.error = std::move(err);
    return r;
}

double HashResult::speedMbps() const {
    if (duration <= 0.0 || fileSize == 0) return 0.0;
    return (static_cast<double>(fileSize) / Constants::BYTES_PER_MB) / duration;
}

void HashOperationMetrics::start(uint64_t files, uint64_t bytes) {
    startTime = Clock::now();
    endTime.reset();
    totalFiles = files;
    totalBytes = bytes;
    processedFiles = 0;
    processedBytes = 0;
    failedFiles = 0;
    currentFile.clear();
}

void HashOperationMetrics::finalize() {
    if (!endTime) endTime = Clock::now();
}

double HashOperationMetrics::durationSeconds() const {
    if (startTime == Clock::time_point{}) return 0.0;
    auto end = endTime ? *endTime : Clock::now();
    return std::chrono::duration<double>(end - startTime).count();
}

int HashOperationMetrics::progressPercent() const {
    if (totalFiles == 0) return 0;
    return static_cast<int>((processedFiles * 100) / totalFiles);
}

double HashOperationMetrics::averageSpeedMbps() const {
    double seconds = durationSeconds();
    if (seconds <= 0.0 || processedBytes == 0) return 0.0;
    return (static_cast<double>(processedBytes) / Constants::BYTES_PER_MB) / seconds;
}

}
