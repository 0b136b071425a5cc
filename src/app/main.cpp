// 1. Standard Library
#include <csignal>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

// 2. Third Party
#include <boost/asio.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// 3. Local Headers
#include "Server.hpp"
#include "config.hpp"

namespace asio = boost::asio;

static void setup_logging(const switchboard::LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;

    // A. Console Sink
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sinks.push_back(console_sink);

    // B. Rotating File Sink (Max 5MB, 3 files)
    if (!cfg.file.empty()) {
        constexpr size_t MAX_SIZE = 1024 * 1024 * 5;
        constexpr size_t MAX_FILES = 3;
        auto parent = std::filesystem::path(cfg.file).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        auto file_sink =
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.file, MAX_SIZE, MAX_FILES);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    // C. Register Logger
    auto logger = std::make_shared<spdlog::logger>("switchboard", sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    // D. Global Formatting
    const auto level = spdlog::level::from_str(cfg.level);
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    spdlog::flush_on(spdlog::level::warn);
}

int main(int argc, char* argv[]) {
    try {
        if (argc > 2) {
            spdlog::critical("Usage: switchboard [config.toml]");
            return EXIT_FAILURE;
        }
        const std::string config_path = argc == 2 ? argv[1] : "config.toml";

        // 1. Configuration, then logging as configured
        auto config = switchboard::LoadConfig(config_path);
        setup_logging(config.logging);

        // 2. Server Setup
        asio::io_context main_ioc;
        auto server = std::make_shared<switchboard::network::Server>(main_ioc, std::move(config));

        // 3. Graceful Shutdown Signal
        asio::signal_set signals(main_ioc, SIGINT, SIGTERM);
        signals.async_wait([&server](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            spdlog::info("Stop signal ({}) received. Shutting down...", signal_number);
            server->Stop();
        });

        spdlog::info("Switchboard starting with '{}'", config_path);

        // 4. Run
        server->Start();

        spdlog::info("Server shutdown complete.");

    } catch (const std::exception& e) {
        spdlog::critical("Fatal Error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
