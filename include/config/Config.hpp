#pragma once

#include <filesystem>
#include <string>
#include <cstdint>
#include <spdlog/spdlog.h>

namespace ql::config {

constexpr static unsigned int MAX_SHORT_CODE_LENGTH = 32;
constexpr static uintmax_t MAX_REQUEST_BODY_BYTES = 16 * 1024; // 16KB

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    unsigned int io_threads = 2;
    unsigned int worker_threads = 8;
    uintmax_t max_body_bytes = MAX_REQUEST_BODY_BYTES;
    unsigned int io_timeout_seconds = 30; // per socket read, and per write
    std::string cors_allow_origin = "*";  // empty disables CORS headers
};

struct ShortenerConfig {
    std::string base_url = "http://localhost:8080";
    unsigned int code_length = 7;
    unsigned int max_attempts = 5;
    unsigned int custom_code_max_length = MAX_SHORT_CODE_LENGTH;
    bool assume_https_scheme = true; // "example.com/x" is stored as "https://example.com/x"
};

struct QRConfig {
    bool enabled = true;
    unsigned int module_scale = 10; // pixels per QR module
    unsigned int border = 4;        // quiet zone, in modules
    std::string error_correction = "L";
    std::string key_prefix = "qr/";
};

struct BlobStorageConfig {
    std::string endpoint;           // https://<account>.r2.cloudflarestorage.com, http://minio:9000, ...
    std::string region = "auto";
    std::string bucket = "qr-codes";
    std::string access_key;
    std::string secret_access_key;
    std::string public_base_url;    // falls back to <endpoint>/<bucket> when empty
};

enum class DatabaseBackend { Postgres, Memory };

struct DatabaseConfig {
    DatabaseBackend backend = DatabaseBackend::Postgres;
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "quicklink";
    std::string user = "quicklink";
    std::string password;
    unsigned int pool_size = 8;

    [[nodiscard]] std::string connectionString() const;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum quicklink = spdlog::level::info;  // startup/shutdown
    spdlog::level::level_enum http      = spdlog::level::warn;  // 5xx, malformed requests
    spdlog::level::level_enum db        = spdlog::level::err;   // unreachable DB, failed tx
    spdlog::level::level_enum cloud     = spdlog::level::warn;  // blob storage upload failures
    spdlog::level::level_enum qr        = spdlog::level::warn;  // render failures
    spdlog::level::level_enum link      = spdlog::level::info;  // allocation and conflicts
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/quicklink";
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    ServerConfig server;
    ShortenerConfig shortener;
    QRConfig qr;
    BlobStorageConfig blob_storage;
    DatabaseConfig database;
    LoggingConfig logging;

    // Throws std::invalid_argument naming the first offending key.
    void validate() const;
};

std::string to_string(DatabaseBackend backend);
DatabaseBackend database_backend_from_string(const std::string& str);

// A missing file yields defaults; secrets may be overridden from the environment.
Config loadConfig(const std::filesystem::path& path);

void applyEnvOverrides(Config& cfg);

// Effective config as YAML, without secrets.
std::string dumpConfig(const Config& cfg);

}
