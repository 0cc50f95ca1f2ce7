/**
 * @file WebhookUploader.hpp
 * @brief cpp-httplib implementation of domain::Uploader for webhook endpoints.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/Uploader.hpp"

namespace steamcorder::infrastructure {

/**
 * @class WebhookUploader
 * @brief POSTs a file as the multipart field "file" and classifies the response.
 *
 * Any 2xx status is a success. There is no retry; one failed attempt is final.
 */
class WebhookUploader : public domain::Uploader {
public:
    /** @brief A URL split into what httplib::Client and Client::Post expect. */
    struct UrlParts {
        std::string schemeHostPort; ///< e.g. "https://discord.com" or "http://127.0.0.1:8080"
        std::string pathAndQuery;   ///< e.g. "/api/webhooks/1/abc?wait=true"
    };

    domain::UploadResult upload(const domain::UploadRequest& request) override;

    /** @brief Splits an http(s) URL, dropping any fragment. Returns nullopt for anything else. */
    static std::optional<UrlParts> SplitUrl(const std::string& url);

    /** @brief MIME type sent with the multipart part, chosen by extension. */
    static std::string ContentTypeFor(const std::string& fileName);
};

} // namespace steamcorder::infrastructure
