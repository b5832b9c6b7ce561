#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <stdexcept>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

namespace ql::config {

namespace {

// libpq keyword/value quoting: wrap in single quotes, escape \ and '
std::string quoteConnValue(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\\' || c == '\'') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

void overrideFromEnv(std::string& target, const char* name) {
    if (const char* v = std::getenv(name); v && *v) target = v;
}

}

std::string to_string(const DatabaseBackend backend) {
    switch (backend) {
        case DatabaseBackend::Postgres: return "postgres";
        case DatabaseBackend::Memory: return "memory";
        default: throw std::invalid_argument("Unknown DatabaseBackend enum value");
    }
}

DatabaseBackend database_backend_from_string(const std::string& str) {
    static const std::unordered_map<std::string, DatabaseBackend> mapping = {
        {"postgres", DatabaseBackend::Postgres}, {"postgresql", DatabaseBackend::Postgres},
        {"memory", DatabaseBackend::Memory}
    };
    if (const auto it = mapping.find(str); it != mapping.end()) return it->second;
    throw std::invalid_argument("Invalid database backend: " + str);
}

std::string DatabaseConfig::connectionString() const {
    std::string out = "host=" + quoteConnValue(host) +
                      " port=" + std::to_string(port) +
                      " dbname=" + quoteConnValue(name) +
                      " user=" + quoteConnValue(user);
    if (!password.empty()) out += " password=" + quoteConnValue(password);
    out += " connect_timeout=5";
    return out;
}

void Config::validate() const {
    if (server.io_threads == 0) throw std::invalid_argument("server.io_threads must be at least 1");
    if (server.worker_threads == 0) throw std::invalid_argument("server.worker_threads must be at least 1");
    if (server.max_body_bytes == 0) throw std::invalid_argument("server.max_body_bytes must be positive");
    if (server.io_timeout_seconds == 0) throw std::invalid_argument("server.io_timeout_seconds must be at least 1");

    if (shortener.base_url.empty()) throw std::invalid_argument("shortener.base_url must not be empty");
    if (shortener.code_length < 4 || shortener.code_length > MAX_SHORT_CODE_LENGTH)
        throw std::invalid_argument("shortener.code_length must be between 4 and 32");
    if (shortener.max_attempts == 0) throw std::invalid_argument("shortener.max_attempts must be at least 1");
    if (shortener.custom_code_max_length == 0 || shortener.custom_code_max_length > MAX_SHORT_CODE_LENGTH)
        throw std::invalid_argument("shortener.custom_code_max_length must be between 1 and 32");

    if (qr.module_scale == 0) throw std::invalid_argument("qr.module_scale must be at least 1");
    if (qr.error_correction != "L" && qr.error_correction != "M" &&
        qr.error_correction != "Q" && qr.error_correction != "H")
        throw std::invalid_argument("qr.error_correction must be one of L, M, Q, H");

    if (database.pool_size == 0) throw std::invalid_argument("database.pool_size must be at least 1");
}

void applyEnvOverrides(Config& cfg) {
    overrideFromEnv(cfg.database.password, "QL_DB_PASSWORD");
    overrideFromEnv(cfg.blob_storage.access_key, "QL_S3_ACCESS_KEY");
    overrideFromEnv(cfg.blob_storage.secret_access_key, "QL_S3_SECRET_ACCESS_KEY");
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;

    if (std::filesystem::exists(path)) {
        const YAML::Node root = YAML::LoadFile(path.string());

        if (const auto node = root["server"]) YAML::convert<ServerConfig>::decode(node, cfg.server);
        if (const auto node = root["shortener"]) YAML::convert<ShortenerConfig>::decode(node, cfg.shortener);
        if (const auto node = root["qr"]) YAML::convert<QRConfig>::decode(node, cfg.qr);
        if (const auto node = root["blob_storage"]) YAML::convert<BlobStorageConfig>::decode(node, cfg.blob_storage);
        if (const auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
        if (const auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    }

    applyEnvOverrides(cfg);
    cfg.validate();
    return cfg;
}

std::string dumpConfig(const Config& cfg) {
    YAML::Node root;
    root["server"] = cfg.server;
    root["shortener"] = cfg.shortener;
    root["qr"] = cfg.qr;
    root["blob_storage"] = cfg.blob_storage;
    root["database"] = cfg.database;
    root["logging"] = cfg.logging;

    YAML::Emitter out;
    out << root;
    return out.c_str();
}

}
