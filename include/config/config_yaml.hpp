#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ql::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

inline std::string level_to_string(const spdlog::level::level_enum lvl) {
    return to_std_string(spdlog::level::to_string_view(lvl));
}

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["io_threads"] = rhs.io_threads;
        node["worker_threads"] = rhs.worker_threads;
        node["max_body_bytes"] = rhs.max_body_bytes;
        node["io_timeout_seconds"] = rhs.io_timeout_seconds;
        node["cors_allow_origin"] = rhs.cors_allow_origin;
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        rhs.port = node["port"].as<uint16_t>(8080);
        rhs.io_threads = node["io_threads"].as<unsigned int>(2);
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(8);
        rhs.max_body_bytes = node["max_body_bytes"].as<uintmax_t>(MAX_REQUEST_BODY_BYTES);
        rhs.io_timeout_seconds = node["io_timeout_seconds"].as<unsigned int>(30);
        rhs.cors_allow_origin = node["cors_allow_origin"].as<std::string>("*");
        return true;
    }
};

template<>
struct convert<ShortenerConfig> {
    static Node encode(const ShortenerConfig& rhs) {
        Node node;
        node["base_url"] = rhs.base_url;
        node["code_length"] = rhs.code_length;
        node["max_attempts"] = rhs.max_attempts;
        node["custom_code_max_length"] = rhs.custom_code_max_length;
        node["assume_https_scheme"] = rhs.assume_https_scheme;
        return node;
    }

    static bool decode(const Node& node, ShortenerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.base_url = node["base_url"].as<std::string>("http://localhost:8080");
        rhs.code_length = node["code_length"].as<unsigned int>(7);
        rhs.max_attempts = node["max_attempts"].as<unsigned int>(5);
        rhs.custom_code_max_length = node["custom_code_max_length"].as<unsigned int>(MAX_SHORT_CODE_LENGTH);
        rhs.assume_https_scheme = node["assume_https_scheme"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<QRConfig> {
    static Node encode(const QRConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["module_scale"] = rhs.module_scale;
        node["border"] = rhs.border;
        node["error_correction"] = rhs.error_correction;
        node["key_prefix"] = rhs.key_prefix;
        return node;
    }

    static bool decode(const Node& node, QRConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.module_scale = node["module_scale"].as<unsigned int>(10);
        rhs.border = node["border"].as<unsigned int>(4);
        rhs.error_correction = node["error_correction"].as<std::string>("L");
        rhs.key_prefix = node["key_prefix"].as<std::string>("qr/");
        return true;
    }
};

template<>
struct convert<BlobStorageConfig> {
    // Credentials are never written back out.
    static Node encode(const BlobStorageConfig& rhs) {
        Node node;
        node["endpoint"] = rhs.endpoint;
        node["region"] = rhs.region;
        node["bucket"] = rhs.bucket;
        node["public_base_url"] = rhs.public_base_url;
        return node;
    }

    static bool decode(const Node& node, BlobStorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.endpoint = node["endpoint"].as<std::string>("");
        rhs.region = node["region"].as<std::string>("auto");
        rhs.bucket = node["bucket"].as<std::string>("qr-codes");
        rhs.access_key = node["access_key"].as<std::string>("");
        rhs.secret_access_key = node["secret_access_key"].as<std::string>("");
        rhs.public_base_url = node["public_base_url"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["backend"] = to_string(rhs.backend);
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.backend = database_backend_from_string(node["backend"].as<std::string>("postgres"));
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("quicklink");
        rhs.user = node["user"].as<std::string>("quicklink");
        rhs.password = node["password"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<unsigned int>(8);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["quicklink"] = level_to_string(rhs.quicklink);
        node["http"]      = level_to_string(rhs.http);
        node["db"]        = level_to_string(rhs.db);
        node["cloud"]     = level_to_string(rhs.cloud);
        node["qr"]        = level_to_string(rhs.qr);
        node["link"]      = level_to_string(rhs.link);
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.quicklink = spdlog::level::from_str(node["quicklink"].as<std::string>("info"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("error"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        rhs.qr = spdlog::level::from_str(node["qr"].as<std::string>("warn"));
        rhs.link = spdlog::level::from_str(node["link"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_log_level"] = level_to_string(rhs.console_log_level);
        node["file_log_level"] = level_to_string(rhs.file_log_level);
        node["subsystem_levels"] = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/quicklink");
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

}
