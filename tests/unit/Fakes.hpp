#pragma once

#include "storage/BucketService.hpp"
#include "storage/StoreClient.hpp"
#include "sync/FileSource.hpp"
#include "sync/errors.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace bk::test {

struct PutCall {
    std::string key;
    std::string body;
    std::string contentType;
};

class FakeStore final : public storage::StoreClient {
public:
    std::set<std::string> failKeys;
    std::chrono::milliseconds delay{0};
    std::function<void(const std::string&)> onPut;

    void put(const std::string& key, const std::string& body, const std::string& contentType) const override {
        const auto now = ++inFlight_;
        auto prev = maxInFlight_.load();
        while (now > prev && !maxInFlight_.compare_exchange_weak(prev, now)) {}

        if (delay.count() > 0) std::this_thread::sleep_for(delay);

        --inFlight_;

        if (failKeys.contains(key)) throw sync::TransferError("simulated rejection for " + key);

        {
            std::scoped_lock lock(mutex_);
            calls_.push_back({key, body, contentType});
        }
        if (onPut) onPut(key);
    }

    [[nodiscard]] std::vector<PutCall> calls() const {
        std::scoped_lock lock(mutex_);
        return calls_;
    }

    [[nodiscard]] std::map<std::string, int> keyCounts() const {
        std::map<std::string, int> out;
        for (const auto& c : calls()) ++out[c.key];
        return out;
    }

    [[nodiscard]] int maxInFlight() const { return maxInFlight_.load(); }

private:
    mutable std::mutex mutex_;
    mutable std::vector<PutCall> calls_;
    mutable std::atomic<int> inFlight_{0};
    mutable std::atomic<int> maxInFlight_{0};
};

class FakeFileSource final : public sync::FileSource {
public:
    std::map<std::filesystem::path, std::string> files;

    [[nodiscard]] std::string read(const std::filesystem::path& absPath) const override {
        const auto it = files.find(absPath);
        if (it == files.end()) throw sync::FileReadError("No such file: " + absPath.string());
        return it->second;
    }
};

class FakeBucketService final : public storage::BucketService {
public:
    std::vector<storage::ObjectInfo> objects;
    bool fail = false;

    mutable std::string lastPrefix;
    mutable std::string lastDeleted;
    mutable std::string lastContentType;

    [[nodiscard]] std::vector<storage::ObjectInfo> listObjects(const std::string& prefix) const override {
        if (fail) throw std::runtime_error("simulated list failure");
        lastPrefix = prefix;
        std::vector<storage::ObjectInfo> out;
        for (const auto& o : objects)
            if (o.key.rfind(prefix, 0) == 0) out.push_back(o);
        return out;
    }

    void deleteObject(const std::string& key) const override {
        if (fail) throw std::runtime_error("simulated delete failure");
        lastDeleted = key;
    }

    [[nodiscard]] std::string presignPut(const std::string& key, const std::string& contentType) const override {
        if (fail) throw std::runtime_error("simulated presign failure");
        lastContentType = contentType;
        return "https://store.test/bucket/" + key + "?sig=put";
    }

    [[nodiscard]] std::string presignGet(const std::string& key) const override {
        if (fail) throw std::runtime_error("simulated presign failure");
        return "https://store.test/bucket/" + key + "?sig=get";
    }
};

}
