/**
 * @file UploadResult.hpp
 * @brief Outcome of running one file through the upload pipeline.
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace steamcorder::domain {

/** @brief Why an upload attempt failed. */
enum class UploadErrorKind {
    Network,    ///< Connection, read/write or timeout failure.
    HttpStatus, ///< The server answered with a non-2xx status.
    Unknown     ///< Anything else (bad URL, unreadable file...).
};

inline const char* ToString(UploadErrorKind kind) {
    switch (kind) {
        case UploadErrorKind::Network: return "network";
        case UploadErrorKind::HttpStatus: return "httpStatus";
        case UploadErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

struct UploadSuccess {
    std::int64_t uploadDurationMs = 0; ///< Wall-clock time of the POST call.
    std::int64_t totalDurationMs = 0;  ///< From detection to upload completion.
};

struct UploadSkipped {
    std::string reason;
};

struct UploadFailed {
    UploadErrorKind kind = UploadErrorKind::Unknown;
    std::string message;
    int httpStatus = 0; ///< Set when kind == HttpStatus.
};

using UploadResult = std::variant<UploadSuccess, UploadSkipped, UploadFailed>;

inline bool IsSuccess(const UploadResult& result) {
    return std::holds_alternative<UploadSuccess>(result);
}

} // namespace steamcorder::domain
