#include "util/s3Helpers.hpp"
#include "util/curlWrappers.hpp"
#include "config/Config.hpp"

#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <pugixml.hpp>
#include <sstream>
#include <iomanip>
#include <mutex>
#include <stdexcept>
#include <curl/curl.h>

namespace bk::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string sha256Hex(const std::string_view data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    std::ostringstream oss;
    for (const unsigned char c : hash) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, nullptr);
    return {reinterpret_cast<char*>(digest), SHA256_DIGEST_LENGTH};
}

std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data) {
    unsigned char sig[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), rawKey.data(), static_cast<int>(rawKey.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), sig, nullptr);

    std::ostringstream oss;
    for (const unsigned char i : sig) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(i);
    return oss.str();
}

std::string uriEncode(CURL* curl, const std::string_view s) {
    if (s.empty()) return {};
    char* esc = curl_easy_escape(curl, s.data(), static_cast<int>(s.size()));
    if (!esc) throw std::runtime_error("curl_easy_escape failed");
    std::string out(esc);
    curl_free(esc);
    return out;
}

std::string escapeKeyPreserveSlashes(CURL* curl, const std::string_view key) {
    std::string out;
    out.reserve(key.size());
    size_t start = 0;
    while (true) {
        const auto slash = key.find('/', start);
        out += uriEncode(curl, key.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start));
        if (slash == std::string_view::npos) break;
        out += '/';
        start = slash + 1;
    }
    return out;
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

namespace {
std::string signingKey(const config::S3Config& cfg, const std::string& dateStamp) {
    const std::string kDate    = hmacSha256Raw("AWS4" + cfg.secret_key, dateStamp);
    const std::string kRegion  = hmacSha256Raw(kDate, cfg.region);
    const std::string kService = hmacSha256Raw(kRegion, "s3");
    return hmacSha256Raw(kService, "aws4_request");
}

std::string credentialScope(const config::S3Config& cfg, const std::string& dateStamp) {
    return dateStamp + "/" + cfg.region + "/s3/aws4_request";
}
}

std::string buildAuthorizationHeader(const config::S3Config& cfg,
                                     const std::string& method,
                                     const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     const std::string& canonicalQuery) {
    const std::string algorithm = "AWS4-HMAC-SHA256";
    const std::string amzDate = headers.at("x-amz-date");
    const std::string dateStamp = amzDate.substr(0, 8); // YYYYMMDD

    // std::map keeps the headers sorted, as SigV4 requires
    std::string canonicalHeaders, signedHeaders;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        canonicalHeaders += it->first + ":" + it->second + "\n";
        signedHeaders += it->first;
        if (std::next(it) != headers.end())
            signedHeaders += ";";
    }

    std::ostringstream canonicalRequestStream;
    canonicalRequestStream << method << "\n"
                           << canonicalPath << "\n"
                           << canonicalQuery << "\n"
                           << canonicalHeaders << "\n"
                           << signedHeaders << "\n"
                           << payloadHash;

    const std::string scope = credentialScope(cfg, dateStamp);
    std::ostringstream stringToSignStream;
    stringToSignStream << algorithm << "\n"
                       << amzDate << "\n"
                       << scope << "\n"
                       << sha256Hex(canonicalRequestStream.str());

    const std::string signature = hmacSha256HexFromRaw(signingKey(cfg, dateStamp), stringToSignStream.str());

    std::ostringstream authHeader;
    authHeader << algorithm << " "
               << "Credential=" << cfg.access_key << "/" << scope << ", "
               << "SignedHeaders=" << signedHeaders << ", "
               << "Signature=" << signature;

    return authHeader.str();
}

std::string presignUrl(const config::S3Config& cfg, const PresignRequest& req) {
    const std::string algorithm = "AWS4-HMAC-SHA256";
    const std::string dateStamp = req.amzDate.substr(0, 8);
    const std::string scope = credentialScope(cfg, dateStamp);

    const auto hostStart = req.endpoint.find("//");
    const std::string host = hostStart == std::string::npos ? req.endpoint : req.endpoint.substr(hostStart + 2);

    CurlEasy curl;

    // Parameters must appear in sorted order
    std::ostringstream query;
    query << "X-Amz-Algorithm=" << algorithm
          << "&X-Amz-Credential=" << uriEncode(curl, cfg.access_key + "/" + scope)
          << "&X-Amz-Date=" << req.amzDate
          << "&X-Amz-Expires=" << req.expiresSeconds
          << "&X-Amz-SignedHeaders=host";
    const std::string queryString = query.str();

    std::ostringstream canonicalRequest;
    canonicalRequest << req.method << "\n"
                     << req.canonicalPath << "\n"
                     << queryString << "\n"
                     << "host:" << host << "\n"
                     << "\n"
                     << "host\n"
                     << UNSIGNED_PAYLOAD;

    std::ostringstream stringToSign;
    stringToSign << algorithm << "\n"
                 << req.amzDate << "\n"
                 << scope << "\n"
                 << sha256Hex(canonicalRequest.str());

    const std::string signature = hmacSha256HexFromRaw(signingKey(cfg, dateStamp), stringToSign.str());

    return req.endpoint + req.canonicalPath + "?" + queryString + "&X-Amz-Signature=" + signature;
}

ListPage parseListObjectsXML(const std::string& xml) {
    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_string(xml.c_str());
    if (!result) throw std::runtime_error(std::string("Failed to parse ListObjectsV2 XML: ") + result.description());

    const pugi::xml_node root = doc.child("ListBucketResult");
    if (!root) throw std::runtime_error("ListObjectsV2 XML has no ListBucketResult node");

    ListPage page;
    for (const pugi::xml_node content : root.children("Contents")) {
        const auto keyNode = content.child("Key");
        if (!keyNode) continue;

        storage::ObjectInfo info;
        info.key = keyNode.text().get();
        info.size = content.child("Size").text().as_ullong(0);
        info.lastModified = content.child("LastModified").text().get();
        page.objects.push_back(std::move(info));
    }

    page.truncated = std::string(root.child("IsTruncated").text().get()) == "true";
    page.nextContinuationToken = root.child("NextContinuationToken").text().get();
    if (page.nextContinuationToken.empty()) page.truncated = false;

    return page;
}

}
