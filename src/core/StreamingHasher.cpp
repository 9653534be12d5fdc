#include "core/StreamingHasher.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "core/Constants.hpp"
#include "util/FileMetadata.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace evidhash {

namespace {

/// Closes the descriptor on every exit path
class FileHandle {
public:
    explicit FileHandle(int fd) : fd(fd) {}
    ~FileHandle() { if (fd >= 0) ::close(fd); }
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
    int get() const { return fd; }

private:
    int fd;
};

bool isSet(const Predicate& p) { return p && p(); }

/// Blocks while paused; returns early if cancelled during the pause
void waitWhilePaused(const Predicate& pause, const Predicate& cancel) {
    while (isSet(pause)) {
        if (isSet(cancel)) return;
        std::this_thread::sleep_for(Constants::PAUSE_POLL_INTERVAL);
    }
}

Error cancelledError(const fs::path& file) {
    return Error{ErrorCode::Cancelled, "Hash calculation cancelled by user", "", file.string()};
}

Error errnoError(int err, const std::string& what, const fs::path& file) {
    return Error{errorCodeFromErrno(err), what + " " + file.string() + ": " + std::strerror(err),
                 "", file.string()};
}

}

size_t StreamingHasher::bufferSizeFor(uint64_t fileSize) {
    if (fileSize < Constants::SMALL_FILE_THRESHOLD) return Constants::SMALL_BUFFER;
    if (fileSize < Constants::MEDIUM_FILE_THRESHOLD) return Constants::MEDIUM_BUFFER;
    return Constants::LARGE_BUFFER;
}

Expected<HashResult> StreamingHasher::hashOne(const fs::path& filePath, HashAlgorithm algorithm,
                                              const Predicate& pause, const Predicate& cancel) const {
    return hashOne(DiscoveredFile{filePath, filePath.filename()}, algorithm, pause, cancel);
}

Expected<HashResult> StreamingHasher::hashOne(const DiscoveredFile& file, HashAlgorithm algorithm,
                                              const Predicate& pause, const Predicate& cancel) const {
    const fs::path& path = file.path;

    waitWhilePaused(pause, cancel);
    if (isSet(cancel)) return cancelledError(path);

    auto start = std::chrono::steady_clock::now();

    auto meta = getFileMetadata(path);
    if (!meta) return meta.error();
    if (!meta.value().isRegular) {
        return Error{ErrorCode::IoError, "Not a regular file: " + path.string(), "", path.string()};
    }

    FileHandle fh(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (fh.get() < 0) return errnoError(errno, "Cannot open", path);

    const size_t bufferSize = opts.bufferOverride ? opts.bufferOverride : bufferSizeFor(meta.value().sizeBytes);
    std::vector<uint8_t> buffer(bufferSize);
    auto hasher = HasherFactory::create(algorithm);
    uint64_t bytesHashed = 0;

    while (true) {
        waitWhilePaused(pause, cancel);
        if (isSet(cancel)) return cancelledError(path);

        ssize_t n = ::read(fh.get(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return errnoError(errno, "Read failed for", path);
        }
        if (n == 0) break;

        hasher->update(buffer.data(), static_cast<size_t>(n));
        bytesHashed += static_cast<uint64_t>(n);
        if (opts.onChunk) opts.onChunk(static_cast<size_t>(n));
    }

    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    std::string hex = IHasher::toHex(hasher->digest());
    Logger::instance().debug(std::string(toString(algorithm)) + " " + hex + " " + path.string());

    return HashResult::success(path, file.relativePath, algorithm, std::move(hex), bytesHashed, seconds);
}

}
