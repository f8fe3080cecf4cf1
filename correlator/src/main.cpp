#include "config.hpp"
#include "correlator_service.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <memory>
#include <atomic>
#include <thread>
#include <chrono>

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
    auto logger = std::make_shared<spdlog::logger>("correlator", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
    spdlog::flush_on(spdlog::level::info);

    spdlog::info("Starting incident correlator...");

    // File first, then environment overrides
    Config config;
    try {
        if (argc > 1) {
            config.load_from_file(argv[1]);
            spdlog::info("Configuration loaded from {}", argv[1]);
        }
        config.load_from_env();
        config.validate();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
    } catch (const InvalidConfigError& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::unique_ptr<CorrelatorService> service;
    try {
        service = std::make_unique<CorrelatorService>(config);
        service->run();
    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize or start the service: {}", e.what());
        return 1;
    }

    // Wait for termination signal
    while (!g_terminate_flag) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Termination signal received. Shutting down...");
    service->stop();
    spdlog::info("Correlator has shut down. Exiting.");

    return 0;
}
