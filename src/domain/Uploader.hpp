/**
 * @file Uploader.hpp
 * @brief Interface for services that push one file to a remote sink.
 */

#pragma once

#include <chrono>
#include <string>

#include "domain/UploadResult.hpp"

namespace steamcorder::domain {

/**
 * @struct UploadRequest
 * @brief Everything needed to post a single file.
 */
struct UploadRequest {
    std::string url;       ///< Destination, e.g. https://host/api/webhooks/...
    std::string fileName;  ///< Base name sent with the multipart part.
    std::string contents;  ///< Raw file bytes.
    std::chrono::seconds timeout{30};
};

/**
 * @class Uploader
 * @brief Performs one synchronous upload attempt. Never retries.
 *
 * Implementations return UploadSuccess with uploadDurationMs filled in, or
 * UploadFailed. totalDurationMs is the caller's to compute.
 */
class Uploader {
public:
    virtual ~Uploader() = default;

    virtual UploadResult upload(const UploadRequest& request) = 0;
};

} // namespace steamcorder::domain
