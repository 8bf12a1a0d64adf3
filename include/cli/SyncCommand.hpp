#pragma once

#include "cli/types.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace bk::cli {

// Missing or unknown arguments. Callers print usage and exit 1.
struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct SyncArgs {
    std::filesystem::path dir;
    std::string prefix;
    bool dry = false;
    int concurrency = 5;
    bool concurrencyGiven = false;
    std::filesystem::path configPath;
    bool help = false;
};

std::string syncUsage(const std::string& program = "bucketeer-sync");

// Throws UsageError for shape problems and sync::InvalidConfig for bad values.
SyncArgs parseSyncArgs(const CommandCall& call);

SyncArgs parseSyncArgs(const std::vector<std::string>& args);

}
