#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace switchboard::core {

/**
 * @brief Contract for receiving session lifecycle events.
 *
 * @details
 * **Pattern:** Observer / Listener.
 * **Thread Safety:** Methods are called directly from the I/O threads that
 * drive sessions, possibly concurrently. Implementations must be fast and
 * non-blocking (atomic counters, a short critical section, a log line).
 */
struct ISessionObserver {
    virtual ~ISessionObserver() = default;

    virtual void OnSessionCreated(const std::string& session_id, std::size_t backend_count) = 0;

    // One per backend connection attempt made by the factory.
    virtual void OnBackendInitialized(const std::string& session_id, const std::string& backend_id,
                                      std::chrono::microseconds latency, bool success) = 0;

    // A live connection was replaced after a backend-side failure.
    virtual void OnBackendReinitialized(const std::string& session_id,
                                        const std::string& backend_id,
                                        const std::string& reason) = 0;

    virtual void OnSessionClosed(const std::string& session_id) = 0;

    // One per routed call, retries included. operation is the kind and the
    // client-facing name, e.g. "tool:fs_read" or "resource:file:///etc/motd".
    virtual void OnOperationCompleted(const std::string& session_id, const std::string& backend_id,
                                      const std::string& operation,
                                      std::chrono::microseconds latency, bool success) = 0;
};

}  // namespace switchboard::core
