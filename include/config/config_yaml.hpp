#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace bk::config;

template<>
struct convert<S3Config> {
    static Node encode(const S3Config& rhs) {
        Node node;
        node["endpoint"] = rhs.endpoint;
        node["region"] = rhs.region;
        node["bucket"] = rhs.bucket;
        node["access_key"] = rhs.access_key;
        node["secret_key"] = rhs.secret_key;
        node["presign_expiry_seconds"] = rhs.presign_expiry_seconds;
        return node;
    }

    static bool decode(const Node& node, S3Config& rhs) {
        if (!node.IsMap()) return false;
        rhs.endpoint = node["endpoint"].as<std::string>("");
        rhs.region = node["region"].as<std::string>("us-east-1");
        rhs.bucket = node["bucket"].as<std::string>("");
        rhs.access_key = node["access_key"].as<std::string>("");
        rhs.secret_key = node["secret_key"].as<std::string>("");
        rhs.presign_expiry_seconds = node["presign_expiry_seconds"].as<unsigned int>(DEFAULT_PRESIGN_EXPIRY_SECONDS);
        return true;
    }
};

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["threads"] = rhs.threads;
        node["static_dir"] = rhs.static_dir.string();
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        rhs.port = node["port"].as<uint16_t>(3000);
        rhs.threads = node["threads"].as<unsigned int>(2);
        rhs.static_dir = node["static_dir"].as<std::string>("public");
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["concurrency"] = rhs.concurrency;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.concurrency = node["concurrency"].as<unsigned int>(DEFAULT_SYNC_CONCURRENCY);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["bucketeer"] = to_std_string(spdlog::level::to_string_view(rhs.bucketeer));
        node["sync"]      = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["cloud"]     = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["http"]      = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["fs"]        = to_std_string(spdlog::level::to_string_view(rhs.fs));
        node["config"]    = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.bucketeer = spdlog::level::from_str(node["bucketeer"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("info"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("warn"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node = convert<LogLevelsConfig>::encode(rhs.levels);
        node["log_dir"] = rhs.log_dir.string();
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        return convert<LogLevelsConfig>::decode(node, rhs.levels);
    }
};

}
