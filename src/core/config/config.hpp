#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "BackendTarget.hpp"
#include "CapabilityAggregator.hpp"
#include "SessionFactory.hpp"
#include "SessionManager.hpp"

namespace switchboard {

struct ServerConfig {
    std::string address = "0.0.0.0";
    uint16_t port = 8080;  // NOLINT
    unsigned int threads = 1;
    std::string endpoint = "/mcp";

    // Per-connection HTTP limits.
    std::chrono::seconds idle_timeout{60};
    std::chrono::seconds request_timeout{120};
    std::uint64_t max_body_bytes = 10ULL * 1024 * 1024;
    unsigned int max_requests_per_connection = 0;  // 0 means unlimited
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/switchboard.log";
};

struct StoreConfig {
    std::chrono::seconds ttl{1800};
    std::chrono::seconds sweep_interval{60};
};

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    core::SessionManagerConfig sessions;
    StoreConfig store;
    core::SessionFactoryConfig factory;
    core::AggregationConfig aggregation;
    std::string incoming_auth = "anonymous";  // anonymous | bearer
    std::vector<core::BackendTarget> backends;
};

/**
 * @brief Loads configuration from a TOML file.
 * @param path Path to the .toml file (default: "config.toml")
 * @return Parsed AppConfig object; defaults when the file does not exist.
 * @throws std::runtime_error if the file cannot be parsed or is invalid.
 */
AppConfig LoadConfig(const std::string& path = "config.toml");

// Same as LoadConfig(), from TOML text.
AppConfig ParseConfig(std::string_view text);

}  // namespace switchboard
