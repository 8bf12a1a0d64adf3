#pragma once

#include "sync/model/RunSummary.hpp"
#include "sync/model/SyncJob.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace bk::storage {
class StoreClient;
}

namespace bk::sync {

class FileSource;

// enumerate -> upload -> summarize
class SyncRunner {
public:
    SyncRunner(std::shared_ptr<storage::StoreClient> store,
               std::string bucket,
               std::shared_ptr<FileSource> source = nullptr,
               std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);

    // DirectoryNotFound propagates. Per-file failures are reported in the summary.
    [[nodiscard]] model::RunSummary run(const model::SyncJob& job) const;

private:
    std::shared_ptr<storage::StoreClient> store_;
    std::string bucket_;
    std::shared_ptr<FileSource> source_;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;
};

}
