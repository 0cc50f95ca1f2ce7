#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <variant>

#include <httplib.h>

#include "infrastructure/WebhookUploader.hpp"

using namespace steamcorder;
using infrastructure::WebhookUploader;

namespace {

domain::UploadRequest MakeRequest(const std::string& url) {
    domain::UploadRequest request;
    request.url = url;
    request.fileName = "shot.png";
    request.contents = std::string(1024, '\x89');
    request.timeout = std::chrono::seconds(5);
    return request;
}

void TestSplitUrl() {
    auto discord = WebhookUploader::SplitUrl("https://discord.com/api/webhooks/123/abc?wait=true");
    assert(discord);
    assert(discord->schemeHostPort == "https://discord.com");
    assert(discord->pathAndQuery == "/api/webhooks/123/abc?wait=true");

    auto local = WebhookUploader::SplitUrl("HTTP://127.0.0.1:8080");
    assert(local);
    assert(local->schemeHostPort == "http://127.0.0.1:8080");
    assert(local->pathAndQuery == "/");

    auto queryOnly = WebhookUploader::SplitUrl("http://example.org?x=1");
    assert(queryOnly && queryOnly->pathAndQuery == "/?x=1");

    auto bareFragment = WebhookUploader::SplitUrl("http://example.org#top");
    assert(bareFragment);
    assert(bareFragment->schemeHostPort == "http://example.org");
    assert(bareFragment->pathAndQuery == "/");

    auto pathFragment = WebhookUploader::SplitUrl("http://example.org/hook?wait=true#frag");
    assert(pathFragment && pathFragment->pathAndQuery == "/hook?wait=true");

    assert(!WebhookUploader::SplitUrl("discord.com/api/webhooks"));
    assert(!WebhookUploader::SplitUrl("ftp://example.org/file"));
    assert(!WebhookUploader::SplitUrl("http:///missing-host"));
}

void TestContentTypes() {
    assert(WebhookUploader::ContentTypeFor("a.png") == "image/png");
    assert(WebhookUploader::ContentTypeFor("a.JPEG") == "image/jpeg");
    assert(WebhookUploader::ContentTypeFor("a.jpg") == "image/jpeg");
    assert(WebhookUploader::ContentTypeFor("a.gif") == "image/gif");
    assert(WebhookUploader::ContentTypeFor("a.bmp") == "image/bmp");
    assert(WebhookUploader::ContentTypeFor("a.bin") == "application/octet-stream");
}

} // namespace

int main() {
    std::cout << "[Test] Starting WebhookUploader Test..." << std::endl;

    TestSplitUrl();
    TestContentTypes();

    // Local stand-in for the webhook.
    httplib::Server server;
    std::string receivedName;
    std::size_t receivedSize = 0;
    std::string receivedType;

    server.Post("/ok", [&](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_file("file")) {
            res.status = 422;
            return;
        }
        const auto& file = req.get_file_value("file");
        receivedName = file.filename;
        receivedSize = file.content.size();
        receivedType = file.content_type;
        res.status = 200;
        res.set_content("{}", "application/json");
    });
    server.Post("/nocontent", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });
    server.Post("/bad", [](const httplib::Request&, httplib::Response& res) {
        res.status = 400;
        res.set_content("bad request", "text/plain");
    });
    server.Post("/error", [](const httplib::Request&, httplib::Response& res) {
        res.status = 500;
    });

    const int port = server.bind_to_any_port("127.0.0.1");
    assert(port > 0);
    std::thread serverThread([&server]() { server.listen_after_bind(); });
    for (int i = 0; i < 200 && !server.is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(server.is_running());

    const std::string base = "http://127.0.0.1:" + std::to_string(port);
    WebhookUploader uploader;

    {
        auto result = uploader.upload(MakeRequest(base + "/ok"));
        auto* success = std::get_if<domain::UploadSuccess>(&result);
        assert(success);
        assert(success->uploadDurationMs >= 0);
        assert(receivedName == "shot.png");
        assert(receivedSize == 1024);
        assert(receivedType == "image/png");
    }
    {
        auto result = uploader.upload(MakeRequest(base + "/nocontent"));
        assert(domain::IsSuccess(result));
    }
    {
        auto result = uploader.upload(MakeRequest(base + "/bad"));
        auto* failed = std::get_if<domain::UploadFailed>(&result);
        assert(failed);
        assert(failed->kind == domain::UploadErrorKind::HttpStatus);
        assert(failed->httpStatus == 400);
    }
    {
        auto result = uploader.upload(MakeRequest(base + "/error"));
        auto* failed = std::get_if<domain::UploadFailed>(&result);
        assert(failed);
        assert(failed->kind == domain::UploadErrorKind::HttpStatus);
        assert(failed->httpStatus == 500);
    }
    {
        auto result = uploader.upload(MakeRequest("not a url"));
        auto* failed = std::get_if<domain::UploadFailed>(&result);
        assert(failed && failed->kind == domain::UploadErrorKind::Unknown);
    }

    server.stop();
    serverThread.join();

    // Nothing listens on the port any more.
    {
        auto result = uploader.upload(MakeRequest(base + "/ok"));
        auto* failed = std::get_if<domain::UploadFailed>(&result);
        assert(failed);
        assert(failed->kind == domain::UploadErrorKind::Network);
        assert(!failed->message.empty());
    }

    // https always comes back as a result, with or without OpenSSL compiled in.
    {
        const std::string secure = "https://127.0.0.1:" + std::to_string(port) + "/api/webhooks/1/x";
        auto result = uploader.upload(MakeRequest(secure));
        auto* failed = std::get_if<domain::UploadFailed>(&result);
        assert(failed);
        assert(failed->kind == domain::UploadErrorKind::Network);
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
        assert(failed->message == "https requires OpenSSL support");
#endif
    }

    std::cout << "[PASS] WebhookUploader Test." << std::endl;
    return 0;
}
