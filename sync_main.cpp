#include "cli/SyncCommand.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "storage/s3/S3Controller.hpp"
#include "sync/SyncRunner.hpp"
#include "sync/errors.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace bk::cli;
using namespace bk::config;
using namespace bk::logging;
using namespace bk::sync;
using namespace bk::sync::model;

namespace {
const auto interrupted = std::make_shared<std::atomic<bool>>(false);

void signalHandler(const int) {
    interrupted->store(true);
}
}

int main(const int argc, char** argv) {
    SyncArgs args;
    try {
        std::vector<std::string> raw(argv + 1, argv + argc);
        args = parseSyncArgs(raw);
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n\n" << syncUsage(argv[0]);
        return EXIT_FAILURE;
    } catch (const InvalidConfig& e) {
        std::cerr << e.what() << "\n";
        return EXIT_FAILURE;
    }

    if (args.help) {
        std::cout << syncUsage(argv[0]);
        return EXIT_SUCCESS;
    }

    try {
        auto cfg = loadConfig(args.configPath.empty() ? DEFAULT_CONFIG_PATH : args.configPath);
        applyEnvOverrides(cfg);
        if (!args.concurrencyGiven) args.concurrency = static_cast<int>(cfg.sync.concurrency);
        ConfigRegistry::init(std::move(cfg));
        LogRegistry::init(ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    const auto& s3 = ConfigRegistry::get().s3;
    if (const auto missing = s3.validate()) {
        LogRegistry::bucketeer()->error("Missing {} in configuration or environment.", *missing);
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        const auto job = SyncJob::make(args.dir, args.prefix, args.concurrency, args.dry);
        const auto store = std::make_shared<bk::cloud::S3Controller>(s3);
        const SyncRunner runner(store, s3.bucket, nullptr, interrupted);

        const auto summary = runner.run(job);
        LogRegistry::shutdown();
        return summary.exitCode();
    } catch (const SyncError& e) {
        LogRegistry::bucketeer()->error("{}", e.what());
    } catch (const std::exception& e) {
        LogRegistry::bucketeer()->error("[-] Sync failed: {}", e.what());
    }

    LogRegistry::shutdown();
    return EXIT_FAILURE;
}
