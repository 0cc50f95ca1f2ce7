/**
 * @file WebhookUploader.cpp
 * @brief Implementation of WebhookUploader.
 */

#include "infrastructure/WebhookUploader.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace steamcorder::infrastructure {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
    return value;
}

} // namespace

std::optional<WebhookUploader::UrlParts> WebhookUploader::SplitUrl(const std::string& rawUrl) {
    // Fragments never reach the server.
    const std::string url = rawUrl.substr(0, rawUrl.find('#'));
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }
    const std::string scheme = ToLower(url.substr(0, schemeEnd));
    if (scheme != "http" && scheme != "https") {
        return std::nullopt;
    }

    const auto authorityStart = schemeEnd + 3;
    const auto pathStart = url.find_first_of("/?", authorityStart);
    const std::string authority = url.substr(authorityStart,
        pathStart == std::string::npos ? std::string::npos : pathStart - authorityStart);
    if (authority.empty()) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.schemeHostPort = scheme + "://" + authority;
    if (pathStart == std::string::npos) {
        parts.pathAndQuery = "/";
    } else if (url[pathStart] == '?') {
        parts.pathAndQuery = "/" + url.substr(pathStart);
    } else {
        parts.pathAndQuery = url.substr(pathStart);
    }
    return parts;
}

std::string WebhookUploader::ContentTypeFor(const std::string& fileName) {
    const std::string ext = ToLower(std::filesystem::path(fileName).extension().string());
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif") return "image/gif";
    if (ext == ".bmp") return "image/bmp";
    return "application/octet-stream";
}

domain::UploadResult WebhookUploader::upload(const domain::UploadRequest& request) {
    auto parts = SplitUrl(request.url);
    if (!parts) {
        return domain::UploadFailed{domain::UploadErrorKind::Unknown, "invalid webhook URL", 0};
    }

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (parts->schemeHostPort.rfind("https://", 0) == 0) {
        std::cerr << "[WebhookUploader] https webhook but built without OpenSSL." << std::endl;
        return domain::UploadFailed{domain::UploadErrorKind::Network, "https requires OpenSSL support", 0};
    }
#endif

    try {
        httplib::Client cli(parts->schemeHostPort);
        const auto timeoutSeconds = static_cast<time_t>(request.timeout.count());
        cli.set_connection_timeout(timeoutSeconds, 0);
        cli.set_read_timeout(timeoutSeconds, 0);
        cli.set_write_timeout(timeoutSeconds, 0);

        httplib::MultipartFormDataItems items = {
            {"file", request.contents, request.fileName, ContentTypeFor(request.fileName)},
        };

        const auto started = std::chrono::steady_clock::now();
        auto res = cli.Post(parts->pathAndQuery, items);
        const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();

        if (!res) {
            std::string reason = httplib::to_string(res.error());
            std::cerr << "[WebhookUploader] Connection failed: " << reason << std::endl;
            return domain::UploadFailed{domain::UploadErrorKind::Network, reason, 0};
        }

        if (res->status < 200 || res->status >= 300) {
            std::cerr << "[WebhookUploader] HTTP Error " << res->status << ": " << res->body << std::endl;
            return domain::UploadFailed{domain::UploadErrorKind::HttpStatus,
                                        "HTTP " + std::to_string(res->status), res->status};
        }

        domain::UploadSuccess success;
        success.uploadDurationMs = elapsedMs;
        return success;
    } catch (const std::exception& e) {
        // httplib::Client throws on a scheme it was not built for.
        std::cerr << "[WebhookUploader] Upload aborted: " << e.what() << std::endl;
        return domain::UploadFailed{domain::UploadErrorKind::Unknown, e.what(), 0};
    }
}

} // namespace steamcorder::infrastructure
