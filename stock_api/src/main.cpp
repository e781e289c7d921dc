#include "aggregation_facade.hpp"
#include "api_routes.hpp"
#include "api_server.hpp"
#include "config.hpp"
#include "pg_stock_store.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <memory>
#include <thread>

// Global atomic flag to handle termination signals
std::atomic<bool> g_terminate_flag(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_terminate_flag = true;
    }
}

int main(int argc, char* argv[]) {
    // Set up logger
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("stock_api", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
    spdlog::flush_on(spdlog::level::info);

    std::string config_path;
    if (argc > 2 && std::strcmp(argv[1], "-c") == 0) {
        config_path = argv[2];
    } else if (argc > 1) {
        config_path = argv[1];
    }

    Config config;
    try {
        if (!config_path.empty()) {
            config.load_file(config_path);
        }
        config.load_env();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        config.validate();
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load configuration: {}", e.what());
        spdlog::critical("Usage: {} [-c <config.json>]", argv[0]);
        return 1;
    }

    spdlog::info("Starting {}...", config.service_name);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::unique_ptr<PostgresStockStore> store;
    std::unique_ptr<AggregationFacade> facade;
    std::unique_ptr<ApiRoutes> routes;
    std::unique_ptr<ApiServer> server;
    try {
        store = std::make_unique<PostgresStockStore>(config);
        facade = std::make_unique<AggregationFacade>(*store, config.data_dir);
        routes = std::make_unique<ApiRoutes>(*facade, config.service_name);
        server = std::make_unique<ApiServer>(config, *routes);
        server->start();
    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize or start the service: {}", e.what());
        return 1;
    }

    spdlog::info("Serving price history files from '{}'", config.data_dir);

    while (!g_terminate_flag && server->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Termination requested. Shutting down...");
    server->stop();

    spdlog::info("{} has shut down.", config.service_name);
    spdlog::shutdown();
    return 0;
}
