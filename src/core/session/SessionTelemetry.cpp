#include "SessionTelemetry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace switchboard::core {

namespace json = boost::json;

void SessionTelemetry::LatencyStats::Record(std::chrono::microseconds latency, bool success) {
    ++count;
    if (!success) {
        ++failures;
    }
    total_us += latency.count();
    max_us = std::max<std::int64_t>(max_us, latency.count());
}

json::object SessionTelemetry::LatencyStats::ToJson() const {
    json::object obj;
    obj["count"] = count;
    obj["failures"] = failures;
    obj["mean_us"] = count == 0 ? 0 : total_us / static_cast<std::int64_t>(count);
    obj["max_us"] = max_us;
    return obj;
}

void SessionTelemetry::OnSessionCreated(const std::string& session_id, std::size_t backend_count) {
    ++sessions_created_;
    ++active_sessions_;
    spdlog::info("event=session_created session={} backends={}", session_id, backend_count);
}

void SessionTelemetry::OnBackendInitialized(const std::string& session_id,
                                            const std::string& backend_id,
                                            std::chrono::microseconds latency, bool success) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backend_init_[backend_id].Record(latency, success);
    }
    spdlog::info("event=backend_initialized session={} backend={} success={} latency_us={}",
                 session_id, backend_id, success, latency.count());
}

void SessionTelemetry::OnBackendReinitialized(const std::string& session_id,
                                              const std::string& backend_id,
                                              const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++reinitializations_[backend_id];
    }
    spdlog::info("event=backend_reinitialized session={} backend={} reason=\"{}\"", session_id,
                 backend_id, reason);
}

void SessionTelemetry::OnSessionClosed(const std::string& session_id) {
    ++sessions_closed_;
    --active_sessions_;
    spdlog::info("event=session_closed session={}", session_id);
}

void SessionTelemetry::OnOperationCompleted(const std::string& session_id,
                                            const std::string& backend_id,
                                            const std::string& operation,
                                            std::chrono::microseconds latency, bool success) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        operations_[operation].Record(latency, success);
    }
    spdlog::debug("event=operation_completed session={} backend={} operation={} success={} "
                  "latency_us={}",
                  session_id, backend_id, operation, success, latency.count());
}

json::object SessionTelemetry::Snapshot() const {
    json::object out;
    out["active_sessions"] = active_sessions_.load();
    out["sessions_created"] = sessions_created_.load();
    out["sessions_closed"] = sessions_closed_.load();

    std::lock_guard<std::mutex> lock(mutex_);

    json::object init;
    for (const auto& [backend, stats] : backend_init_) {
        init[backend] = stats.ToJson();
    }
    out["backend_initialization"] = std::move(init);

    json::object ops;
    for (const auto& [op, stats] : operations_) {
        ops[op] = stats.ToJson();
    }
    out["operations"] = std::move(ops);

    json::object reinit;
    for (const auto& [backend, n] : reinitializations_) {
        reinit[backend] = n;
    }
    out["reinitializations"] = std::move(reinit);
    return out;
}

}  // namespace switchboard::core
