// Config
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

// Database
#include "database/DBPool.hpp"
#include "database/PgLinkStore.hpp"
#include "database/init_db_tables.hpp"
#include "link/MemoryLinkStore.hpp"

// Services
#include "runtime/Deps.hpp"
#include "storage/s3/S3Controller.hpp"
#include "concurrency/ThreadPool.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/Server.hpp"
#include "util/parse.hpp"

// Libraries
#include <boost/asio.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <optional>
#include <thread>

using namespace ql::config;
using namespace ql::concurrency;
using namespace ql::database;
using namespace ql::logging;
using namespace ql::protocols;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}

struct CliOptions {
    std::filesystem::path configPath = ql::paths::getConfigPath();
    std::optional<uint16_t> port;
    bool printConfig = false;
};

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <path>] [--port <port>] [--print-config]\n";
}

CliOptions parseArgs(const int argc, char** argv) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + std::string(arg));
            return argv[++i];
        };

        if (arg == "--config") opts.configPath = next();
        else if (arg == "--port") {
            const auto port = ql::util::parseInt64(next(), "--port");
            if (port < 1 || port > 65535) throw std::invalid_argument("--port must be between 1 and 65535");
            opts.port = static_cast<uint16_t>(port);
        } else if (arg == "--print-config") opts.printConfig = true;
        else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            std::exit(EXIT_SUCCESS);
        } else throw std::invalid_argument("Unknown argument: " + std::string(arg));
    }
    return opts;
}

std::shared_ptr<ql::link::LinkStore> makeLinkStore(const Config& cfg) {
    if (cfg.database.backend == DatabaseBackend::Memory) {
        LogRegistry::quicklink()->warn("[*] Using in-memory link store; links are lost on restart");
        return std::make_shared<ql::link::MemoryLinkStore>();
    }

    const auto connStr = cfg.database.connectionString();
    seed::init_tables_if_not_exists(connStr);
    return std::make_shared<PgLinkStore>(std::make_shared<DBPool>(connStr, cfg.database.pool_size));
}
}

int main(const int argc, char** argv) {
    CliOptions cli;
    try {
        cli = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        auto cfg = loadConfig(cli.configPath);
        if (cli.port) cfg.server.port = *cli.port;
        if (cli.printConfig) {
            std::cout << dumpConfig(cfg) << std::endl;
            return EXIT_SUCCESS;
        }
        ConfigRegistry::init(std::move(cfg));
        LogRegistry::init(ConfigRegistry::get().logging.log_dir);
    } catch (const std::exception& e) {
        std::cerr << "[-] Failed to load configuration from " << cli.configPath << ": " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    try {
        const auto& config = ConfigRegistry::get();
        LogRegistry::quicklink()->info("[*] Initializing QuickLink (config: {})", cli.configPath.string());

        std::shared_ptr<ql::storage::BlobStore> blobStore;
        if (config.qr.enabled) blobStore = std::make_shared<ql::storage::S3Controller>(config.blob_storage);

        const auto deps = ql::runtime::Deps::build(config, makeLinkStore(config), blobStore);
        const auto router = std::make_shared<const http::Router>(deps, config.server.cors_allow_origin);
        const auto workers = std::make_shared<ThreadPool>(config.server.worker_threads);

        boost::asio::io_context ioc(static_cast<int>(config.server.io_threads));
        const auto server = std::make_shared<http::Server>(
            ioc, resolveEndpoint(config.server.host, config.server.port), router, workers, config.server.max_body_bytes,
            std::chrono::seconds(config.server.io_timeout_seconds));
        server->run();

        std::vector<std::thread> ioThreads;
        ioThreads.reserve(config.server.io_threads);
        for (unsigned int i = 0; i < config.server.io_threads; ++i) ioThreads.emplace_back([&ioc] { ioc.run(); });

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        LogRegistry::quicklink()->info("[✓] QuickLink serving on {}:{}", config.server.host, config.server.port);

        while (!shouldExit) std::this_thread::sleep_for(std::chrono::milliseconds(200));

        LogRegistry::quicklink()->info("[*] Shutdown signal received, stopping...");

        server->stop();
        workers->stop();
        ioc.stop();
        for (auto& t : ioThreads) if (t.joinable()) t.join();

        LogRegistry::quicklink()->info("[✓] QuickLink shut down cleanly.");
        spdlog::shutdown();
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        LogRegistry::quicklink()->error("[-] Failed to start QuickLink: {}", e.what());
        return EXIT_FAILURE;
    }
}
