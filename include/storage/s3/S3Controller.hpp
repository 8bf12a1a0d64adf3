#pragma once

#include "config/Config.hpp"
#include "storage/BucketService.hpp"
#include "storage/StoreClient.hpp"
#include "util/curlWrappers.hpp"

#include <map>
#include <string>
#include <vector>
#include <curl/curl.h>

namespace bk::cloud {

// Path-style S3 client: <endpoint>/<bucket>/<escaped key>, SigV4 signed.
class S3Controller final : public storage::StoreClient, public storage::BucketService {
public:
    explicit S3Controller(config::S3Config cfg);

    ~S3Controller() override;

    // #########################################################################
    // ########################### OBJECT OPS ##################################
    // #########################################################################

    void put(const std::string& key, const std::string& body, const std::string& contentType) const override;

    void deleteObject(const std::string& key) const override;

    [[nodiscard]] std::vector<storage::ObjectInfo> listObjects(const std::string& prefix) const override;

    // #########################################################################
    // ########################### PRESIGNED URLS ##############################
    // #########################################################################

    [[nodiscard]] std::string presign(const std::string& method, const std::string& key,
                                      unsigned int expirySeconds) const;

    [[nodiscard]] std::string presignPut(const std::string& key, const std::string& contentType) const override;

    [[nodiscard]] std::string presignGet(const std::string& key) const override;

    [[nodiscard]] const config::S3Config& config() const { return cfg_; }

private:
    config::S3Config cfg_;
    std::string endpoint_;

    [[nodiscard]] std::map<std::string, std::string> buildHeaderMap(const std::string& payloadHash) const;

    [[nodiscard]] std::pair<std::string, std::string> constructPaths(CURL* curl, const std::string& key) const;

    [[nodiscard]] util::SList makeSigHeaders(const std::string& method,
                                             const std::string& canonical,
                                             const std::string& payloadHash,
                                             const std::string& query = "") const;
};

}
