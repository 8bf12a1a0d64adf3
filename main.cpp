#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/Server.hpp"
#include "storage/s3/S3Controller.hpp"

#include <boost/asio.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <vector>

using namespace bk::config;
using namespace bk::logging;
using namespace bk::protocols::http;

namespace {
std::atomic shouldExit = false;
std::atomic reopenLogs = false;

void signalHandler(const int signum) {
    if (signum == SIGHUP) reopenLogs = true;
    else shouldExit = true;
}
}

int main(const int argc, char** argv) {
    try {
        const std::string configPath = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;
        auto cfg = loadConfig(configPath);
        applyEnvOverrides(cfg);
        ConfigRegistry::init(std::move(cfg));
        LogRegistry::init(ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    try {
        const auto& conf = ConfigRegistry::get();

        if (const auto missing = conf.s3.validate()) {
            LogRegistry::bucketeer()->error("[-] Missing required setting: {}", *missing);
            return EXIT_FAILURE;
        }
        if (conf.s3.access_key.empty() || conf.s3.secret_key.empty())
            LogRegistry::bucketeer()->warn("[!] AWS_ACCESS_KEY_ID or AWS_SECRET_ACCESS_KEY not set, signed URLs will be rejected");

        LogRegistry::bucketeer()->info("[*] Starting bucketeer API for bucket {}", conf.s3.bucket);

        const auto bucket = std::make_shared<bk::cloud::S3Controller>(conf.s3);
        const auto router = std::make_shared<const Router>(bucket, conf.server.static_dir);

        boost::asio::io_context ioc;
        const tcp::endpoint endpoint{boost::asio::ip::make_address(conf.server.host), conf.server.port};
        const auto server = std::make_shared<Server>(ioc, endpoint, router);
        server->run();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGHUP, signalHandler);

        const auto nThreads = std::max(1u, conf.server.threads);
        std::vector<std::thread> threads;
        threads.reserve(nThreads);
        for (unsigned int i = 0; i < nThreads; ++i) threads.emplace_back([&ioc] { ioc.run(); });

        while (!shouldExit) {
            if (reopenLogs.exchange(false)) {
                LogRegistry::reopenMainLog();
                LogRegistry::bucketeer()->info("[*] Log files reopened");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }

        LogRegistry::bucketeer()->info("[*] Shutting down bucketeer API...");

        server->stop();
        ioc.stop();
        for (auto& t : threads) t.join();

        LogRegistry::bucketeer()->info("[✓] bucketeer API shut down cleanly.");
        LogRegistry::shutdown();
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        LogRegistry::bucketeer()->error("[-] Failed to start bucketeer API: {}", e.what());
        LogRegistry::shutdown();
        return EXIT_FAILURE;
    }
}
