#include "sync/BoundedUploader.hpp"
#include "sync/FileSource.hpp"
#include "sync/KeyMapper.hpp"
#include "sync/errors.hpp"
#include "storage/StoreClient.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/sync/UploadTask.hpp"
#include "util/mime.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <future>

using namespace bk::sync;
using namespace bk::sync::model;
using namespace bk::concurrency;
using namespace bk::logging;

UploadBatch::UploadBatch(const std::vector<FileEntry>& entries,
                         const SyncJob& job,
                         const storage::StoreClient& store,
                         const FileSource& source,
                         std::shared_ptr<std::atomic<bool>> interruptFlag)
    : entries(entries), job(job), store(store), source(source),
      interruptFlag(std::move(interruptFlag)), queue(entries.size()), results(entries.size()) {}

bool UploadBatch::interrupted() const {
    return interruptFlag && interruptFlag->load();
}

void UploadBatch::process(const size_t index) {
    const auto& entry = entries[index];
    auto& result = results[index];

    result.key = mapKey(entry.relativePath, job.prefix());
    result.contentType = util::mimeTypeFor(entry.relativePath);

    try {
        const auto body = source.read(entry.absolutePath);
        result.bytes = body.size();

        if (job.dryRun()) {
            LogRegistry::sync()->info("[dry] PUT {} ({} bytes)", result.key, body.size());
            result.status = UploadStatus::DryRun;
            return;
        }

        store.put(result.key, body, result.contentType);
        LogRegistry::sync()->info("PUT {}", result.key);
        result.status = UploadStatus::Uploaded;
    } catch (const FileReadError& e) {
        result.status = UploadStatus::FileReadError;
        result.error = e.what();
        LogRegistry::sync()->error("[BoundedUploader] Failed to read {}: {}", entry.absolutePath.string(), e.what());
    } catch (const std::exception& e) {
        result.status = UploadStatus::TransferError;
        result.error = e.what();
        LogRegistry::sync()->error("[BoundedUploader] Failed to upload {}: {}", result.key, e.what());
    }
}

BoundedUploader::BoundedUploader(const storage::StoreClient& store,
                                 const FileSource& source,
                                 std::shared_ptr<std::atomic<bool>> interruptFlag)
    : store_(store), source_(source), interruptFlag_(std::move(interruptFlag)) {}

unsigned int BoundedUploader::workerCountFor(const unsigned int concurrency, const size_t fileCount) {
    return static_cast<unsigned int>(std::min<size_t>(concurrency, fileCount));
}

std::vector<UploadResult> BoundedUploader::run(const std::vector<FileEntry>& entries, const SyncJob& job) const {
    if (entries.empty()) return {};

    UploadBatch batch(entries, job, store_, source_, interruptFlag_);
    const auto workers = workerCountFor(job.concurrency(), entries.size());

    LogRegistry::sync()->debug("[BoundedUploader] {} files, concurrency {}", entries.size(), job.concurrency());

    std::vector<std::future<ExpectedFuture>> futures;
    futures.reserve(workers);

    {
        ThreadPool pool(workers);
        LogRegistry::sync()->debug("[BoundedUploader] Pool up with {} workers", pool.workerCount());
        for (unsigned int i = 0; i < workers; ++i) {
            auto task = std::make_shared<UploadTask>(batch);
            futures.push_back(task->getFuture().value());
            pool.submit(task);
        }

        // barrier: every worker drains the queue (or sees the interrupt) before this returns
        for (auto& f : futures) {
            const auto handled = std::get<size_t>(f.get());
            LogRegistry::sync()->trace("[BoundedUploader] Worker finished after {} files", handled);
        }
    }

    // Anything never claimed was skipped because of an interrupt
    for (size_t i = 0; i < batch.results.size(); ++i) {
        auto& r = batch.results[i];
        if (r.status != UploadStatus::Cancelled) continue;
        r.key = mapKey(entries[i].relativePath, job.prefix());
        r.contentType = util::mimeTypeFor(entries[i].relativePath);
        r.error = "cancelled before upload";
    }

    return std::move(batch.results);
}
