#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace bk::config {

namespace {
std::optional<std::string> envValue(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (path.empty() || !std::filesystem::exists(path)) return cfg;

    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["s3"]) YAML::convert<S3Config>::decode(node, cfg.s3);
    if (auto node = root["server"]) YAML::convert<ServerConfig>::decode(node, cfg.server);
    if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

void applyEnvOverrides(Config& cfg) {
    if (const auto v = envValue("S3_ENDPOINT")) cfg.s3.endpoint = *v;
    if (const auto v = envValue("AWS_REGION")) cfg.s3.region = *v;
    if (const auto v = envValue("S3_BUCKET")) cfg.s3.bucket = *v;
    if (const auto v = envValue("AWS_ACCESS_KEY_ID")) cfg.s3.access_key = *v;
    if (const auto v = envValue("AWS_SECRET_ACCESS_KEY")) cfg.s3.secret_key = *v;

    if (const auto v = envValue("PORT")) {
        unsigned long port = 0;
        const auto* end = v->data() + v->size();
        const auto [ptr, ec] = std::from_chars(v->data(), end, port);
        if (ec != std::errc() || ptr != end || port == 0 || port > 65535)
            throw std::runtime_error("PORT out of range: " + *v);
        cfg.server.port = static_cast<uint16_t>(port);
    }
}

std::string S3Config::effectiveEndpoint() const {
    std::string ep = endpoint.empty() ? "https://s3." + region + ".amazonaws.com" : endpoint;
    if (ep.find("://") == std::string::npos) ep = "https://" + ep;
    while (!ep.empty() && ep.back() == '/') ep.pop_back();
    return ep;
}

std::string S3Config::host() const {
    const auto ep = effectiveEndpoint();
    const auto start = ep.find("//") + 2;
    const auto end = ep.find('/', start);
    return ep.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::optional<std::string> S3Config::validate() const {
    if (bucket.empty()) return "S3_BUCKET";
    if (region.empty()) return "AWS_REGION";
    return std::nullopt;
}

} // namespace bk::config
