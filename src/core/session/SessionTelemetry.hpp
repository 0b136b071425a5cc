#pragma once

#include <atomic>
#include <boost/json.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "ISessionObserver.hpp"

namespace switchboard::core {

/**
 * @brief Default observability sink.
 *
 * Logs every event as one structured line (`event=... session=... backend=...`)
 * and keeps process-wide counters that GET /metrics serves as JSON.
 */
class SessionTelemetry : public ISessionObserver {
   public:
    void OnSessionCreated(const std::string& session_id, std::size_t backend_count) override;
    void OnBackendInitialized(const std::string& session_id, const std::string& backend_id,
                              std::chrono::microseconds latency, bool success) override;
    void OnBackendReinitialized(const std::string& session_id, const std::string& backend_id,
                                const std::string& reason) override;
    void OnSessionClosed(const std::string& session_id) override;
    void OnOperationCompleted(const std::string& session_id, const std::string& backend_id,
                              const std::string& operation, std::chrono::microseconds latency,
                              bool success) override;

    std::int64_t active_sessions() const noexcept { return active_sessions_.load(); }

    boost::json::object Snapshot() const;

   private:
    struct LatencyStats {
        std::uint64_t count = 0;
        std::uint64_t failures = 0;
        std::int64_t total_us = 0;
        std::int64_t max_us = 0;

        void Record(std::chrono::microseconds latency, bool success);
        boost::json::object ToJson() const;
    };

    std::atomic<std::int64_t> active_sessions_{0};
    std::atomic<std::uint64_t> sessions_created_{0};
    std::atomic<std::uint64_t> sessions_closed_{0};

    mutable std::mutex mutex_;
    std::map<std::string, LatencyStats> backend_init_;
    std::map<std::string, LatencyStats> operations_;
    std::map<std::string, std::uint64_t> reinitializations_;
};

}  // namespace switchboard::core
