#pragma once

#include <filesystem>
#include <string>

namespace bk::sync::model {

namespace fs = std::filesystem;

// One sync invocation. Immutable once built.
class SyncJob {
public:
    static constexpr int DEFAULT_CONCURRENCY = 5;

    // Throws InvalidConfig on an empty root or a non-positive concurrency.
    // A relative root is resolved against the current working directory.
    static SyncJob make(const fs::path& root, std::string prefix = {},
                        int concurrency = DEFAULT_CONCURRENCY, bool dryRun = false);

    [[nodiscard]] const fs::path& root() const { return root_; }
    [[nodiscard]] const std::string& prefix() const { return prefix_; }
    [[nodiscard]] unsigned int concurrency() const { return concurrency_; }
    [[nodiscard]] bool dryRun() const { return dryRun_; }

private:
    SyncJob(fs::path root, std::string prefix, unsigned int concurrency, bool dryRun);

    fs::path root_;
    std::string prefix_;
    unsigned int concurrency_;
    bool dryRun_;
};

}
