#include "concurrency/sync/UploadTask.hpp"
#include "sync/BoundedUploader.hpp"
#include "logging/LogRegistry.hpp"

using namespace bk::concurrency;
using namespace bk::logging;

UploadTask::UploadTask(sync::UploadBatch& b) : batch(b) {}

void UploadTask::operator()() {
    size_t handled = 0;
    try {
        while (!batch.interrupted()) {
            const auto index = batch.queue.claim();
            if (!index) break;
            batch.process(*index);
            ++handled;
        }
        promise.set_value(handled);
    } catch (const std::exception& e) {
        LogRegistry::sync()->error("[UploadTask] Worker aborted after {} files: {}", handled, e.what());
        promise.set_exception(std::current_exception());
    }
}
