#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace bk::sync::model {

enum class UploadStatus {
    Uploaded,
    DryRun,
    FileReadError,
    TransferError,
    Cancelled
};

std::string to_string(UploadStatus status);

struct UploadResult {
    std::string key;
    std::optional<uint64_t> bytes;          // absent when the file was never read
    std::string contentType;
    UploadStatus status = UploadStatus::Cancelled;
    std::string error;

    [[nodiscard]] bool ok() const {
        return status == UploadStatus::Uploaded || status == UploadStatus::DryRun;
    }

    [[nodiscard]] bool failed() const {
        return status == UploadStatus::FileReadError || status == UploadStatus::TransferError;
    }
};

}
