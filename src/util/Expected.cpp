#include "util/Expected.hpp"

namespace evidhash {

const char* toUserMessage(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "No error.";
        case ErrorCode::InvalidArgs: return "Invalid arguments.";
        case ErrorCode::NotFound: return "Cannot calculate hash: file not found.";
        case ErrorCode::PermissionDenied: return "Cannot access file due to permission restrictions.";
        case ErrorCode::IoError: return "An error occurred while reading the file.";
        case ErrorCode::Cancelled: return "Operation cancelled.";
        case ErrorCode::DetectionFailed: return "Storage type could not be determined.";
        case ErrorCode::InternalError: return "An internal error occurred.";
    }
    return "Unknown error.";
}

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid_args";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::PermissionDenied: return "permission_denied";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::DetectionFailed: return "detection_failed";
        case ErrorCode::InternalError: return "internal_error";
    }
    return "unknown";
}

}
