#include "sync/model/SyncJob.hpp"
#include "sync/errors.hpp"

#include <fmt/format.h>

using namespace bk::sync;
using namespace bk::sync::model;

SyncJob::SyncJob(fs::path root, std::string prefix, const unsigned int concurrency, const bool dryRun)
    : root_(std::move(root)), prefix_(std::move(prefix)), concurrency_(concurrency), dryRun_(dryRun) {}

SyncJob SyncJob::make(const fs::path& root, std::string prefix, const int concurrency, const bool dryRun) {
    if (root.empty()) throw InvalidConfig("sync root directory is required");
    if (concurrency <= 0) throw InvalidConfig(fmt::format("concurrency must be a positive integer, got {}", concurrency));

    auto absRoot = root.is_absolute() ? root : fs::current_path() / root;
    return {absRoot.lexically_normal(), std::move(prefix), static_cast<unsigned int>(concurrency), dryRun};
}
