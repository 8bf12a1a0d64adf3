#pragma once

#include "config/Config.hpp"

#include <mutex>

namespace bk::config {

constexpr static auto DEFAULT_CONFIG_PATH = "/etc/bucketeer/config.yaml";

class ConfigRegistry {
public:
    // First call wins; later calls are ignored.
    static void init(Config config);
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace bk::config
