#include "storage/s3/S3Controller.hpp"
#include "sync/errors.hpp"
#include "util/s3Helpers.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cstring>
#include <tuple>
#include <fmt/format.h>

using namespace bk::cloud;
using namespace bk::util;
using namespace bk::logging;

namespace {
struct ReadCursor {
    const std::string* data;
    size_t offset = 0;
};
}

void S3Controller::put(const std::string& key, const std::string& body, const std::string& contentType) const {
    const std::string payloadHash = sha256Hex(body);

    std::string canonical, url;
    {
        CurlEasy tmpHandle;
        std::tie(canonical, url) = constructPaths(tmpHandle, key);
    }

    SList hdrs = makeSigHeaders("PUT", canonical, payloadHash);
    hdrs.add("Content-Type: " + contentType);
    hdrs.add("Expect:");

    ReadCursor cursor{&body};

    HttpResponse resp;
    try {
        resp = performCurl([&](CURL* h) {
            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
            curl_easy_setopt(h, CURLOPT_READDATA, &cursor);
            curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(body.size()));
            curl_easy_setopt(h, CURLOPT_READFUNCTION,
                +[](char* buf, const size_t sz, const size_t nm, void* ud) -> size_t {
                    auto* c = static_cast<ReadCursor*>(ud);
                    const size_t n = std::min(sz * nm, c->data->size() - c->offset);
                    std::memcpy(buf, c->data->data() + c->offset, n);
                    c->offset += n;
                    return n;
                });
        });
    } catch (const std::exception& e) {
        throw sync::TransferError(fmt::format("PUT {} failed: {}", key, e.what()));
    }

    if (!resp.ok()) {
        LogRegistry::cloud()->error("[S3Controller] put failed for {}: CURL={} HTTP={} Response:\n{}",
                                    key, static_cast<int>(resp.curl), resp.http, resp.body);

        if (resp.curl != CURLE_OK)
            throw sync::TransferError(fmt::format("PUT {} failed: {}", key, curl_easy_strerror(resp.curl)));
        throw sync::TransferError(fmt::format("PUT {} rejected (HTTP {})", key, resp.http));
    }

    LogRegistry::cloud()->debug("[S3Controller] PUT {} ({} bytes, {})", key, body.size(), contentType);
}

void S3Controller::deleteObject(const std::string& key) const {
    std::string canonical, url;
    {
        CurlEasy tmpHandle;
        std::tie(canonical, url) = constructPaths(tmpHandle, key);
    }

    const std::string payloadHash = sha256Hex("");
    const SList hdrs = makeSigHeaders("DELETE", canonical, payloadHash);

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (!resp.ok()) {
        LogRegistry::cloud()->error("[S3Controller] deleteObject failed for {}: CURL={} HTTP={} Response:\n{}",
                                    key, static_cast<int>(resp.curl), resp.http, resp.body);
        throw std::runtime_error(fmt::format("Failed to delete object from S3 (HTTP {}): {}", resp.http, resp.body));
    }
}
