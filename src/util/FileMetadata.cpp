#include "util/FileMetadata.hpp"

#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace evidhash {

ErrorCode errorCodeFromErrno(int err) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
        case ELOOP:
            return ErrorCode::NotFound;
        case EACCES:
        case EPERM:
            return ErrorCode::PermissionDenied;
        default:
            return ErrorCode::IoError;
    }
}

Expected<FileMetadata> getFileMetadata(const fs::path& filePath) {
    struct stat st;
    if (::stat(filePath.c_str(), &st) != 0) {
        int err = errno;
        return Error{errorCodeFromErrno(err),
                     "stat failed for " + filePath.string() + ": " + std::strerror(err),
                     "", filePath.string()};
    }

    FileMetadata metadata;
    metadata.sizeBytes = static_cast<uint64_t>(st.st_size);
    metadata.deviceId = static_cast<uint64_t>(st.st_dev);
    metadata.isRegular = S_ISREG(st.st_mode);
    return metadata;
}

fs::path volumeRootOf(const fs::path& path) {
    std::error_code ec;
    fs::path cur = fs::absolute(path, ec);
    if (ec) cur = path;
    cur = cur.lexically_normal();

    // Start from the nearest existing ancestor
    struct stat st;
    while (::stat(cur.c_str(), &st) != 0) {
        if (!cur.has_parent_path() || cur == cur.parent_path()) return cur.root_path();
        cur = cur.parent_path();
    }

    const dev_t dev = st.st_dev;
    while (cur.has_parent_path() && cur != cur.parent_path()) {
        fs::path parent = cur.parent_path();
        struct stat pst;
        if (::stat(parent.c_str(), &pst) != 0 || pst.st_dev != dev) break;
        cur = parent;
    }
    return cur;
}

}
