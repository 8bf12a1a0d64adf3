#pragma once

#include "sync/model/UploadResult.hpp"

#include <cstdint>
#include <vector>

namespace bk::sync::model {

struct RunSummary {
    unsigned int uploaded = 0;
    unsigned int dryRun = 0;
    unsigned int failed = 0;
    unsigned int cancelled = 0;
    uint64_t totalBytes = 0;                // bytes read from successfully handled files

    static RunSummary from(const std::vector<UploadResult>& results);

    [[nodiscard]] unsigned int total() const { return uploaded + dryRun + failed + cancelled; }
    [[nodiscard]] bool success() const { return failed == 0 && cancelled == 0; }
    [[nodiscard]] int exitCode() const { return success() ? 0 : 1; }
};

}
