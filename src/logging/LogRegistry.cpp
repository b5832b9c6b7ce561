#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>

namespace ql::logging {

void LogRegistry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;
    main_log_path_  = log_dir_ / "quicklink.log";
    audit_log_path_ = log_dir_ / "audit.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    const auto& cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.subsystem_levels;
    makeLogger("quicklink", sub_levels.quicklink);
    makeLogger("http",      sub_levels.http);
    makeLogger("db",        sub_levels.db);
    makeLogger("cloud",     sub_levels.cloud);
    makeLogger("qr",        sub_levels.qr);
    makeLogger("link",      sub_levels.link);

    // audit: file-only sink (append)
    {
        audit_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            audit_log_path_.string(), /*truncate=*/false);
        std::vector<spdlog::sink_ptr> sinks = { audit_file_sink_ };
        const auto logger = std::make_shared<spdlog::logger>("audit", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    spdlog::info("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

}
