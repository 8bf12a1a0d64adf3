#include "storage/s3/S3Controller.hpp"
#include "util/s3Helpers.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <stdexcept>

using namespace bk::cloud;
using namespace bk::util;
using namespace bk::logging;

std::vector<bk::storage::ObjectInfo> S3Controller::listObjects(const std::string& prefix) const {
    std::vector<storage::ObjectInfo> out;
    std::string continuationToken;
    bool moreResults = true;

    while (moreResults) {
        CurlEasy escHandle;

        // Canonical query parameters are sorted by name
        std::string query;
        if (!continuationToken.empty()) query += "continuation-token=" + uriEncode(escHandle, continuationToken) + "&";
        query += "list-type=2";
        if (!prefix.empty()) query += "&prefix=" + uriEncode(escHandle, prefix);

        const std::string canonical = "/" + cfg_.bucket;
        const std::string url = endpoint_ + canonical + "?" + query;

        const std::string payloadHash = sha256Hex("");
        const SList hdrs = makeSigHeaders("GET", canonical, payloadHash, query);

        const HttpResponse resp = performCurl([&](CURL* h) {
            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        });

        if (!resp.ok()) {
            LogRegistry::cloud()->error("[S3Controller] listObjects failed: CURL={} HTTP={} Response:\n{}",
                                        static_cast<int>(resp.curl), resp.http, resp.body);
            throw std::runtime_error(fmt::format("Failed to list objects (HTTP {})", resp.http));
        }

        auto page = parseListObjectsXML(resp.body);
        for (auto& obj : page.objects) out.push_back(std::move(obj));

        moreResults = page.truncated;
        continuationToken = std::move(page.nextContinuationToken);
    }

    LogRegistry::cloud()->debug("[S3Controller] listObjects '{}' returned {} objects", prefix, out.size());
    return out;
}
