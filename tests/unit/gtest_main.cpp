#include <gtest/gtest.h>
#include <iostream>

#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        bk::config::LoggingConfig logging;          // no log_dir: console only
        logging.levels.console_log_level = spdlog::level::warn;
        logging.levels.subsystem_levels.sync = spdlog::level::info;
        bk::logging::LogRegistry::init(logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize bucketeer test environment: " << e.what() << std::endl;
        return 1;
    }

    const int rc = RUN_ALL_TESTS();
    bk::logging::LogRegistry::shutdown();
    return rc;
}
