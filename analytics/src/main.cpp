#include "config.hpp"
#include "market_analyzer.hpp"
#include "snapshot.hpp"
#include "api_server.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

// Global atomic flag to handle termination signals
std::atomic<bool> g_terminate_flag(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_terminate_flag = true;
    }
}

namespace {
    struct CommandLine {
        std::optional<std::string> config_path;
        std::optional<std::string> snapshot_path;
    };

    CommandLine parse_command_line(int argc, char* argv[]) {
        CommandLine cli;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--snapshot") {
                if (i + 1 >= argc) {
                    throw std::runtime_error("--snapshot requires a file argument");
                }
                cli.snapshot_path = argv[++i];
            } else if (!cli.config_path) {
                cli.config_path = arg;
            } else {
                throw std::runtime_error("Unexpected argument: " + arg);
            }
        }
        return cli;
    }
}

int main(int argc, char* argv[]) {
    // Logs go to stderr so a one-shot report on stdout stays clean
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("analytics", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);  // overridden by config
    spdlog::flush_on(spdlog::level::info);

    CommandLine cli;
    Config config;
    try {
        cli = parse_command_line(argc, argv);
        if (cli.config_path) {
            config.load(*cli.config_path);
            spdlog::info("Configuration loaded from {}", *cli.config_path);
        }
        config.load_from_env();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        config.validate();
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load configuration: {}", e.what());
        return 1;
    }

    spdlog::info("Starting FlowScout {} (trend={}, anomaly={}, pressure={})",
                 config.service_name,
                 to_string(config.trend_model),
                 to_string(config.anomaly_mode),
                 to_string(config.pressure_model));

    MarketAnalyzer analyzer(config);

    if (cli.snapshot_path) {
        try {
            AnalysisRequest request = load_snapshot_file(*cli.snapshot_path, config);
            AnalysisReport report = analyzer.analyze(request);
            std::cout << report.to_json().dump(2) << std::endl;
        } catch (const std::exception& e) {
            spdlog::critical("Analysis of {} failed: {}", *cli.snapshot_path, e.what());
            return 1;
        }
        spdlog::shutdown();
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    ApiServer server(config, analyzer);
    try {
        server.start();
    } catch (const std::exception& e) {
        spdlog::critical("Failed to start the API server: {}", e.what());
        return 1;
    }

    while (!g_terminate_flag) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Termination signal received. Shutting down...");
    server.stop();

    spdlog::info("FlowScout analytics has shut down gracefully.");
    spdlog::shutdown();
    return 0;
}
