#include "storage/s3/S3Controller.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <utility>

using namespace bk::cloud;
using namespace bk::util;
using namespace bk::logging;

S3Controller::S3Controller(config::S3Config cfg)
: cfg_(std::move(cfg)), endpoint_(cfg_.effectiveEndpoint()) {
    if (const auto missing = cfg_.validate())
        throw std::invalid_argument("S3Controller requires " + *missing);
    ensureCurlGlobalInit();
}

S3Controller::~S3Controller() = default;

std::pair<std::string, std::string> S3Controller::constructPaths(CURL* curl, const std::string& key) const {
    const auto escapedKey = escapeKeyPreserveSlashes(curl, key);
    const auto canonicalPath = "/" + cfg_.bucket + "/" + escapedKey;
    const auto url = endpoint_ + canonicalPath;
    return {canonicalPath, url};
}

std::map<std::string, std::string> S3Controller::buildHeaderMap(const std::string& payloadHash) const {
    return {
                {"host", cfg_.host()},
                {"x-amz-content-sha256", payloadHash},
                {"x-amz-date", currentAmzDate()}
    };
}

SList S3Controller::makeSigHeaders(const std::string& method,
                                   const std::string& canonical,
                                   const std::string& payloadHash,
                                   const std::string& query) const {
    const auto base = buildHeaderMap(payloadHash);
    const auto auth = buildAuthorizationHeader(cfg_, method, canonical, base, payloadHash, query);

    SList out;
    out.add("Authorization: " + auth);
    for (const auto& [k, v] : base) out.add(k + ": " + v);
    return out;
}
