#include "core/PerformanceProbe.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <random>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "core/Constants.hpp"
#include "util/FileMetadata.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace evidhash {

namespace {

/// Owns the probe file: closes the descriptor and unlinks the path on scope exit
class ProbeFile {
public:
    explicit ProbeFile(fs::path p) : path(std::move(p)) {
        fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    }
    ~ProbeFile() {
        if (fd < 0) return;
        ::close(fd);
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) Logger::instance().warn("probe: could not remove " + path.string() + ": " + ec.message());
    }
    ProbeFile(const ProbeFile&) = delete;
    ProbeFile& operator=(const ProbeFile&) = delete;

    bool ok() const { return fd >= 0; }
    int get() const { return fd; }
    const fs::path& where() const { return path; }

private:
    fs::path path;
    int fd{-1};
};

std::string randomSuffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    std::string s;
    for (int i = 0; i < 8; ++i) s += "0123456789abcdef"[dis(gen)];
    return s;
}

Error probeError(int err, const std::string& what, const fs::path& p) {
    return Error{ErrorCode::DetectionFailed, what + " " + p.string() + ": " + std::strerror(err), "", p.string()};
}

double mbps(size_t bytes, double seconds) {
    // Clamp to 1us so a cached read never divides by zero
    if (seconds < 1e-6) seconds = 1e-6;
    return (static_cast<double>(bytes) / Constants::BYTES_PER_MB) / seconds;
}

}

FilesystemPerformanceProbe::FilesystemPerformanceProbe(fs::path fallbackDir) : fallback(std::move(fallbackDir)) {}

Expected<fs::path> FilesystemPerformanceProbe::sameDeviceFallback(const fs::path& dir) const {
    std::error_code ec;
    fs::path alt = fallback.empty() ? fs::temp_directory_path(ec) : fallback;
    if (ec) return Error{ErrorCode::DetectionFailed, "no writable directory for probe near " + dir.string()};

    // Timing another device would classify the wrong volume
    auto want = getFileMetadata(dir);
    auto have = getFileMetadata(alt);
    if (!want || !have || want.value().deviceId != have.value().deviceId) {
        return Error{ErrorCode::DetectionFailed,
                     "probe: " + dir.string() + " is not writable and " + alt.string() + " is on another device",
                     "", dir.string()};
    }
    if (::access(alt.c_str(), W_OK) != 0) {
        return Error{ErrorCode::DetectionFailed, "probe: no writable directory on the volume of " + dir.string(),
                     "", dir.string()};
    }
    return alt;
}

Expected<ProbeMeasurement> FilesystemPerformanceProbe::measure(const fs::path& target, size_t bytes) {
    using Clock = std::chrono::steady_clock;

    std::error_code ec;
    fs::path dir = fs::is_directory(target, ec) ? target : target.parent_path();
    if (::access(dir.c_str(), W_OK) != 0) {
        auto relocated = sameDeviceFallback(dir);
        if (!relocated) return relocated.error();
        Logger::instance().debug("probe: cannot write to " + dir.string() + ", using " + relocated.value().string());
        dir = relocated.value();
    }

    // Incompressible payload so filesystem compression cannot flatter the result
    std::vector<uint8_t> payload(bytes);
    std::mt19937_64 gen(std::random_device{}());
    for (size_t i = 0; i + 8 <= payload.size(); i += 8) {
        uint64_t v = gen();
        std::memcpy(payload.data() + i, &v, 8);
    }

    ProbeFile file(dir / (".evidhash_storage_probe_" + randomSuffix()));
    if (!file.ok()) return probeError(errno, "cannot create probe file", file.where());

    auto writeStart = Clock::now();
    size_t written = 0;
    while (written < payload.size()) {
        ssize_t n = ::write(file.get(), payload.data() + written, payload.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return probeError(errno, "probe write failed", file.where());
        }
        written += static_cast<size_t>(n);
    }
    if (::fsync(file.get()) != 0) return probeError(errno, "probe fsync failed", file.where());
    double writeSeconds = std::chrono::duration<double>(Clock::now() - writeStart).count();

    if (::lseek(file.get(), 0, SEEK_SET) < 0) return probeError(errno, "probe seek failed", file.where());

    auto readStart = Clock::now();
    size_t readTotal = 0;
    while (readTotal < payload.size()) {
        ssize_t n = ::read(file.get(), payload.data() + readTotal, payload.size() - readTotal);
        if (n < 0) {
            if (errno == EINTR) continue;
            return probeError(errno, "probe read failed", file.where());
        }
        if (n == 0) break;
        readTotal += static_cast<size_t>(n);
    }
    double readSeconds = std::chrono::duration<double>(Clock::now() - readStart).count();

    ProbeMeasurement m{mbps(written, writeSeconds), mbps(readTotal, readSeconds)};
    Logger::instance().debug("probe: " + dir.string() + " write=" + std::to_string(m.writeMbps) +
                             " MB/s read=" + std::to_string(m.readMbps) + " MB/s");
    return m;
}

}
