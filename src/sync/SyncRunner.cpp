#include "sync/SyncRunner.hpp"
#include "sync/BoundedUploader.hpp"
#include "sync/FileSource.hpp"
#include "sync/TreeEnumerator.hpp"
#include "storage/StoreClient.hpp"
#include "util/cmdLineHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace bk::sync;
using namespace bk::sync::model;
using namespace bk::logging;

SyncRunner::SyncRunner(std::shared_ptr<storage::StoreClient> store,
                       std::string bucket,
                       std::shared_ptr<FileSource> source,
                       std::shared_ptr<std::atomic<bool>> interruptFlag)
    : store_(std::move(store)),
      bucket_(std::move(bucket)),
      source_(source ? std::move(source) : std::make_shared<LocalFileSource>()),
      interruptFlag_(std::move(interruptFlag)) {
    if (!store_) throw std::invalid_argument("SyncRunner requires a store client");
}

RunSummary SyncRunner::run(const SyncJob& job) const {
    const auto entries = TreeEnumerator::enumerate(job.root());

    if (entries.empty()) {
        LogRegistry::bucketeer()->info("No files found.");
        return {};
    }

    LogRegistry::bucketeer()->info("Uploading {} files to s3://{}/{}{}", entries.size(), bucket_, job.prefix(),
                                   job.dryRun() ? " (dry run)" : "");

    const BoundedUploader uploader(*store_, *source_, interruptFlag_);
    const auto results = uploader.run(entries, job);
    const auto summary = RunSummary::from(results);

    for (const auto& r : results)
        if (r.failed())
            LogRegistry::bucketeer()->error("[SyncRunner] {} {}: {}", to_string(r.status), r.key, r.error);

    if (summary.cancelled > 0)
        LogRegistry::bucketeer()->warn("[SyncRunner] Interrupted, {} files not uploaded", summary.cancelled);

    LogRegistry::bucketeer()->info("Done. {} uploaded, {} dry-run, {} failed, {} cancelled ({})",
                                   summary.uploaded, summary.dryRun, summary.failed, summary.cancelled,
                                   util::human_bytes(summary.totalBytes));
    return summary;
}
