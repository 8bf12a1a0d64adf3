#pragma once

#include "sync/WorkQueue.hpp"
#include "sync/model/FileEntry.hpp"
#include "sync/model/SyncJob.hpp"
#include "sync/model/UploadResult.hpp"

#include <atomic>
#include <memory>
#include <vector>

namespace bk::storage {
class StoreClient;
}

namespace bk::sync {

class FileSource;

// State shared by the workers of one run. Each result slot is written only by
// the worker that claimed its index.
struct UploadBatch {
    UploadBatch(const std::vector<model::FileEntry>& entries,
                const model::SyncJob& job,
                const storage::StoreClient& store,
                const FileSource& source,
                std::shared_ptr<std::atomic<bool>> interruptFlag);

    const std::vector<model::FileEntry>& entries;
    const model::SyncJob& job;
    const storage::StoreClient& store;
    const FileSource& source;
    std::shared_ptr<std::atomic<bool>> interruptFlag;

    WorkQueue queue;
    std::vector<model::UploadResult> results;

    [[nodiscard]] bool interrupted() const;

    // Read, map and put (or log, in dry mode) the entry at index. Per-file failures land in results[index].
    void process(size_t index);
};

class BoundedUploader {
public:
    BoundedUploader(const storage::StoreClient& store,
                    const FileSource& source,
                    std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);

    // Returns once every worker has finished. results[i] describes entries[i].
    [[nodiscard]] std::vector<model::UploadResult> run(const std::vector<model::FileEntry>& entries,
                                                       const model::SyncJob& job) const;

    // min(concurrency, fileCount)
    static unsigned int workerCountFor(unsigned int concurrency, size_t fileCount);

private:
    const storage::StoreClient& store_;
    const FileSource& source_;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;
};

}
