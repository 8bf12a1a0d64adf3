#pragma once

#include <string>

namespace bk::storage {

// The only store operation the sync core depends on.
class StoreClient {
public:
    virtual ~StoreClient() = default;

    // Throws sync::TransferError when the store rejects or fails the write.
    virtual void put(const std::string& key, const std::string& body, const std::string& contentType) const = 0;
};

}
