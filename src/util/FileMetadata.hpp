#pragma once

#include <cstdint>
#include <filesystem>

#include "util/Expected.hpp"

namespace evidhash {

/**
 * @brief Stat snapshot taken once per file before hashing
 *
 * deviceId identifies the volume; two paths with the same deviceId live on
 * the same mounted filesystem and share one storage detection.
 */
struct FileMetadata {
    uint64_t sizeBytes{0};   // File size in bytes
    uint64_t deviceId{0};    // st_dev of the containing filesystem
    bool isRegular{false};   // Regular file (after following symlinks)
};

/**
 * @brief Read file metadata from filesystem
 *
 * @param filePath Path to file (symlinks are followed)
 * @return FileMetadata, or NotFound / PermissionDenied / IoError
 */
Expected<FileMetadata> getFileMetadata(const std::filesystem::path& filePath);

/// Map an errno value to the matching ErrorCode
ErrorCode errorCodeFromErrno(int err);

/**
 * @brief Find the mount point that contains a path
 *
 * Walks up the parent chain while the device id stays the same.
 * Falls back to the filesystem root of the path if stat fails.
 */
std::filesystem::path volumeRootOf(const std::filesystem::path& path);

}
