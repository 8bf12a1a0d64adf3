#include "sync/model/UploadResult.hpp"
#include "sync/model/RunSummary.hpp"

using namespace bk::sync::model;

std::string bk::sync::model::to_string(const UploadStatus status) {
    switch (status) {
        case UploadStatus::Uploaded: return "uploaded";
        case UploadStatus::DryRun: return "dry-run";
        case UploadStatus::FileReadError: return "file-read-error";
        case UploadStatus::TransferError: return "transfer-error";
        case UploadStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

RunSummary RunSummary::from(const std::vector<UploadResult>& results) {
    RunSummary s;
    for (const auto& r : results) {
        switch (r.status) {
            case UploadStatus::Uploaded: ++s.uploaded; break;
            case UploadStatus::DryRun: ++s.dryRun; break;
            case UploadStatus::FileReadError:
            case UploadStatus::TransferError: ++s.failed; break;
            case UploadStatus::Cancelled: ++s.cancelled; break;
        }
        if (r.ok() && r.bytes) s.totalBytes += *r.bytes;
    }
    return s;
}
