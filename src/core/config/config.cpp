#include "config.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>
#include <toml++/toml.hpp>
#include <unordered_set>

namespace switchboard {

namespace {

std::vector<std::string> StringList(const toml::node_view<const toml::node>& node) {
    std::vector<std::string> out;
    if (const auto* arr = node.as_array()) {
        for (const auto& item : *arr) {
            if (auto s = item.value<std::string>()) {
                out.push_back(*s);
            }
        }
    }
    return out;
}

core::BackendAuth ParseAuth(const toml::node_view<const toml::node>& node, const std::string& id) {
    core::BackendAuth auth;
    if (!node) {
        return auth;
    }
    const std::string type(node["type"].value_or("unauthenticated"));
    if (type == "unauthenticated") {
        auth.type = core::BackendAuth::Type::unauthenticated;
    } else if (type == "header_injection") {
        auth.type = core::BackendAuth::Type::header_injection;
        auth.header_name = node["header"].value_or("Authorization");
        auth.header_value = node["value"].value_or("");
    } else if (type == "pass_through") {
        auth.type = core::BackendAuth::Type::pass_through;
    } else {
        throw std::runtime_error("backend '" + id + "': unknown auth type '" + type + "'");
    }
    return auth;
}

core::BackendTarget ParseBackend(const toml::table& t) {
    const toml::node_view<const toml::node> view{t};

    core::BackendTarget b;
    b.id = view["id"].value_or("");
    b.url = view["url"].value_or("");
    if (b.id.empty() || b.url.empty()) {
        throw std::runtime_error("every [[backends]] entry needs an id and a url");
    }
    b.request_timeout = std::chrono::milliseconds(view["request_timeout_ms"].value_or<int64_t>(30000));
    b.keepalive = view["keepalive"].value_or(true);
    b.auth = ParseAuth(view["auth"], b.id);
    b.tool_filter = StringList(view["filter"]);

    if (const auto* overrides = view["overrides"].as_table()) {
        for (const auto& [key, value] : *overrides) {
            const toml::node_view<const toml::node> ov{value};
            core::ToolOverride o;
            o.name = ov["name"].value_or("");
            o.description = ov["description"].value_or("");
            b.tool_overrides.emplace(std::string(key.str()), std::move(o));
        }
    }
    return b;
}

AppConfig FromTable(const toml::table& tbl) {
    AppConfig config;

    // 1. Server Settings
    if (auto server = tbl["server"]) {
        config.server.address = server["address"].value_or("0.0.0.0");
        config.server.port = server["port"].value_or<uint16_t>(8080);  // NOLINT
        config.server.threads = server["threads"].value_or<unsigned int>(1);
        config.server.endpoint = server["endpoint"].value_or("/mcp");
        config.server.idle_timeout =
            std::chrono::seconds(server["idle_timeout_seconds"].value_or<int64_t>(60));
        config.server.request_timeout =
            std::chrono::seconds(server["request_timeout_seconds"].value_or<int64_t>(120));
        config.server.max_body_bytes = static_cast<uint64_t>(
            server["max_body_bytes"].value_or<int64_t>(10LL * 1024 * 1024));
        config.server.max_requests_per_connection =
            server["max_requests_per_connection"].value_or<unsigned int>(0);
        if (config.server.threads == 0 || config.server.max_body_bytes == 0) {
            throw std::runtime_error("[server] threads and max_body_bytes must be positive");
        }
    }

    // 2. Logging
    if (auto logging = tbl["logging"]) {
        config.logging.level = logging["level"].value_or("info");
        config.logging.file = logging["file"].value_or("logs/switchboard.log");
    }

    // 3. Sessions and their store
    if (auto sessions = tbl["sessions"]) {
        config.sessions.max_sessions = sessions["max_sessions"].value_or<std::size_t>(1000);
        config.sessions.retry_after =
            std::chrono::seconds(sessions["retry_after_seconds"].value_or<int64_t>(5));
        config.store.ttl = std::chrono::seconds(sessions["ttl_seconds"].value_or<int64_t>(1800));
        config.store.sweep_interval =
            std::chrono::seconds(sessions["sweep_interval_seconds"].value_or<int64_t>(60));
    }

    // 4. Session factory
    if (auto factory = tbl["factory"]) {
        config.factory.max_concurrency = factory["max_concurrency"].value_or<std::size_t>(10);
        config.factory.backend_timeout =
            std::chrono::milliseconds(factory["backend_timeout_ms"].value_or<int64_t>(5000));
        config.factory.creation_timeout =
            std::chrono::milliseconds(factory["creation_timeout_ms"].value_or<int64_t>(30000));
        config.factory.keepalive_interval = std::chrono::seconds(
            factory["keepalive_interval_seconds"].value_or<int64_t>(0));
    }

    // 5. Recovery
    if (auto recovery = tbl["recovery"]) {
        auto& r = config.factory.recovery;
        r.max_retries = recovery["max_retries"].value_or<std::size_t>(1);
        r.backoff_initial =
            std::chrono::milliseconds(recovery["backoff_initial_ms"].value_or<int64_t>(100));
        r.backoff_max =
            std::chrono::milliseconds(recovery["backoff_max_ms"].value_or<int64_t>(2000));
        r.breaker.failure_threshold =
            recovery["breaker_failure_threshold"].value_or<std::size_t>(5);
        r.breaker.open_duration =
            std::chrono::seconds(recovery["breaker_open_seconds"].value_or<int64_t>(30));
    }

    // 6. Aggregation
    if (auto aggregation = tbl["aggregation"]) {
        const std::string strategy(aggregation["conflict_resolution"].value_or("prefix"));
        if (strategy == "prefix") {
            config.aggregation.strategy = core::AggregationConfig::Strategy::prefix;
        } else if (strategy == "priority") {
            config.aggregation.strategy = core::AggregationConfig::Strategy::priority;
        } else {
            throw std::runtime_error("unknown conflict_resolution '" + strategy + "'");
        }
        config.aggregation.prefix_format = aggregation["prefix_format"].value_or("{workload}_");
        config.aggregation.priority_order = StringList(aggregation["priority_order"]);
    }

    // 7. Incoming authentication
    if (auto incoming = tbl["incoming_auth"]) {
        config.incoming_auth = incoming["type"].value_or("anonymous");
    }
    if (config.incoming_auth != "anonymous" && config.incoming_auth != "bearer") {
        throw std::runtime_error("unknown incoming_auth type '" + config.incoming_auth + "'");
    }

    // 8. Backends
    if (const auto* backends = tbl["backends"].as_array()) {
        std::unordered_set<std::string> ids;
        for (const auto& node : *backends) {
            const auto* t = node.as_table();
            if (!t) {
                throw std::runtime_error("[[backends]] entries must be tables");
            }
            auto b = ParseBackend(*t);
            if (!ids.insert(b.id).second) {
                throw std::runtime_error("duplicate backend id '" + b.id + "'");
            }
            config.backends.push_back(std::move(b));
        }
    }

    return config;
}

}  // namespace

AppConfig ParseConfig(std::string_view text) {
    toml::table tbl;
    try {
        tbl = toml::parse(text);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config: {}", err.description());
        throw std::runtime_error("Config parse error");
    }
    return FromTable(tbl);
}

AppConfig LoadConfig(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file '{}' not found. Using defaults.", path);
        return AppConfig{};
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config file: {}", err.description());
        throw std::runtime_error("Config parse error");
    }

    auto config = FromTable(tbl);
    spdlog::info("Loaded configuration from {} ({} backend(s))", path, config.backends.size());
    return config;
}

}  // namespace switchboard
