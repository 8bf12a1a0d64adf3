#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bk::storage {

struct ObjectInfo {
    std::string key;
    uint64_t size = 0;
    std::string lastModified;   // ISO 8601, as reported by the store
};

// What the HTTP façade needs from the store: listing, deletion and signed URLs.
class BucketService {
public:
    virtual ~BucketService() = default;

    [[nodiscard]] virtual std::vector<ObjectInfo> listObjects(const std::string& prefix) const = 0;

    virtual void deleteObject(const std::string& key) const = 0;

    [[nodiscard]] virtual std::string presignPut(const std::string& key, const std::string& contentType) const = 0;

    [[nodiscard]] virtual std::string presignGet(const std::string& key) const = 0;
};

}
