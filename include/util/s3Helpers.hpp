#pragma once

#include "storage/BucketService.hpp"

#include <curl/curl.h>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace bk::config {
struct S3Config;
}

namespace bk::util {

constexpr static auto UNSIGNED_PAYLOAD = "UNSIGNED-PAYLOAD";

std::string sha256Hex(std::string_view data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data);

// RFC 3986 escaping of a single component; '/' is escaped too.
std::string uriEncode(CURL* curl, std::string_view s);

// Escapes every segment of an object key, keeping the '/' separators.
std::string escapeKeyPreserveSlashes(CURL* curl, std::string_view key);

size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

std::string buildAuthorizationHeader(const config::S3Config& cfg,
                                     const std::string& method, const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash, const std::string& canonicalQuery = "");

struct PresignRequest {
    std::string method;            // GET, PUT, ...
    std::string endpoint;          // scheme://host[:port]
    std::string canonicalPath;     // already escaped, starts with '/'
    std::string amzDate;           // YYYYMMDDTHHMMSSZ
    unsigned int expiresSeconds = 300;
};

// SigV4 query-string authentication, signing only the host header.
std::string presignUrl(const config::S3Config& cfg, const PresignRequest& req);

struct ListPage {
    std::vector<storage::ObjectInfo> objects;
    std::string nextContinuationToken;
    bool truncated = false;
};

// Parses one ListObjectsV2 response body. Throws on malformed XML.
ListPage parseListObjectsXML(const std::string& xml);

void ensureCurlGlobalInit();

}
