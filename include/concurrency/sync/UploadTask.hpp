#pragma once

#include "concurrency/Task.hpp"

namespace bk::sync {
struct UploadBatch;
}

namespace bk::concurrency {

// One worker loop: claim the next index until the queue is exhausted or the run is interrupted.
// Resolves with the number of files this worker handled.
struct UploadTask final : PromisedTask {
    sync::UploadBatch& batch;

    explicit UploadTask(sync::UploadBatch& b);

    void operator()() override;
};

}
