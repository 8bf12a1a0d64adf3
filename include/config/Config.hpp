#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace bk::config {

constexpr static unsigned int DEFAULT_SYNC_CONCURRENCY = 5;
constexpr static unsigned int DEFAULT_PRESIGN_EXPIRY_SECONDS = 60 * 5;

struct S3Config {
    std::string endpoint;               // empty -> https://s3.<region>.amazonaws.com
    std::string region = "us-east-1";
    std::string bucket;
    std::string access_key;
    std::string secret_key;
    unsigned int presign_expiry_seconds = DEFAULT_PRESIGN_EXPIRY_SECONDS;

    // Endpoint with scheme and without a trailing slash.
    [[nodiscard]] std::string effectiveEndpoint() const;

    // Host[:port] portion of the effective endpoint, as signed in the `host` header.
    [[nodiscard]] std::string host() const;

    // Names the first missing required field, if any.
    [[nodiscard]] std::optional<std::string> validate() const;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 3000;
    unsigned int threads = 2;
    std::filesystem::path static_dir = "public";
};

struct SyncConfig {
    unsigned int concurrency = DEFAULT_SYNC_CONCURRENCY;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum bucketeer = spdlog::level::info;   // Startup, shutdown, run summaries
    spdlog::level::level_enum sync      = spdlog::level::info;   // One line per file plus failures
    spdlog::level::level_enum cloud     = spdlog::level::warn;   // S3 errors, not routine requests
    spdlog::level::level_enum http      = spdlog::level::info;
    spdlog::level::level_enum fs        = spdlog::level::warn;
    spdlog::level::level_enum config    = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;      // empty -> console only
    LogLevelsConfig levels;
};

struct Config {
    S3Config s3;
    ServerConfig server;
    SyncConfig sync;
    LoggingConfig logging;
};

// Missing file -> defaults. Malformed YAML throws.
Config loadConfig(const std::filesystem::path& path);

// S3_ENDPOINT, AWS_REGION, S3_BUCKET, AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, PORT
void applyEnvOverrides(Config& cfg);

} // namespace bk::config
