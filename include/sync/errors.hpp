#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace bk::sync {

struct SyncError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Malformed job or CLI values. Fatal before any work starts.
struct InvalidConfig : SyncError {
    using SyncError::SyncError;
};

// Sync root missing, not a directory, or not traversable.
struct DirectoryNotFound : SyncError {
    explicit DirectoryNotFound(const std::filesystem::path& p, const std::string& why = "directory not found")
        : SyncError(why + ": " + p.string()), path(p) {}

    std::filesystem::path path;
};

// One file could not be read. Recorded per file, siblings continue.
struct FileReadError : SyncError {
    using SyncError::SyncError;
};

// The store rejected or failed a put. Recorded per file, siblings continue.
struct TransferError : SyncError {
    using SyncError::SyncError;
};

}
