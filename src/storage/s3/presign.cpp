#include "storage/s3/S3Controller.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

using namespace bk::cloud;
using namespace bk::util;
using namespace bk::logging;

std::string S3Controller::presign(const std::string& method, const std::string& key,
                                  const unsigned int expirySeconds) const {
    PresignRequest req;
    req.method = method;
    req.endpoint = endpoint_;
    {
        CurlEasy tmpHandle;
        req.canonicalPath = constructPaths(tmpHandle, key).first;
    }
    req.amzDate = currentAmzDate();
    req.expiresSeconds = expirySeconds;

    LogRegistry::cloud()->debug("[S3Controller] presigned {} {} for {}s", method, key, expirySeconds);
    return presignUrl(cfg_, req);
}

// Only the host header is signed, so the browser may send any Content-Type.
std::string S3Controller::presignPut(const std::string& key, const std::string&) const {
    return presign("PUT", key, cfg_.presign_expiry_seconds);
}

std::string S3Controller::presignGet(const std::string& key) const {
    return presign("GET", key, cfg_.presign_expiry_seconds);
}
