#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "BackendTarget.hpp"
#include "CircuitBreaker.hpp"
#include "IBackendConnection.hpp"
#include "ICredentialResolver.hpp"
#include "ISession.hpp"
#include "ISessionObserver.hpp"
#include "Identity.hpp"

namespace switchboard::core {

struct RecoveryConfig {
    std::size_t max_retries = 1;  // recoveries per original call
    std::chrono::milliseconds backoff_initial{100};
    std::chrono::milliseconds backoff_max{2000};
    CircuitBreakerConfig breaker;
};

// Everything SessionFactory assembled for one session.
struct SessionParts {
    std::string id;
    Identity identity;
    std::vector<BackendTarget> targets;  // every requested backend
    std::unordered_map<std::string, BackendConnectionPtr> connections;
    std::map<std::string, std::string> init_failures;  // backend id -> reason
    // Name prefix of each failed backend, empty when names are not prefixed.
    std::map<std::string, std::string> failed_prefixes;
    AggregationResult aggregation;
};

// Collaborators a session needs after creation, for re-initialization.
struct SessionDeps {
    std::shared_ptr<IConnectionFactory> connector;
    std::shared_ptr<ICredentialResolver> resolver;
    std::shared_ptr<ISessionObserver> observer;  // optional
    RecoveryConfig recovery;
    std::chrono::milliseconds backend_timeout{5000};
};

/**
 * @brief The unit of client isolation: owns a fixed set of backend
 * connections, routes operations to them and manages their re-initialization.
 *
 * @details
 * **State machine:** Populated (active) -> Closed (terminal). Placeholders
 * (the "Created" state) live in SessionManager, before a Session exists.
 *
 * **Locking:** one reader-writer lock guards the connection map, the routing
 * table, the backend token map and the closed flag. Calls hold the read lock
 * only to snapshot the target connection and bump the in-flight counter; all
 * network I/O happens after it is released. Re-initialization takes the write
 * lock only to swap the map entry.
 *
 * **Shutdown:** Close() flips `closed` first, waits until the in-flight
 * counter drains to zero, then closes every connection.
 *
 * Re-initialization is best effort: backend-side state held by the replaced
 * connection (an open interactive context, for example) is lost.
 */
class Session : public ISession, public std::enable_shared_from_this<Session> {
   public:
    Session(boost::asio::any_io_executor ex, SessionParts parts, SessionDeps deps);
    ~Session() override;  // Impl must be complete

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& Id() const override;

    boost::asio::awaitable<boost::json::value> CallTool(std::string name,
                                                        boost::json::object arguments) override;
    boost::asio::awaitable<boost::json::value> ReadResource(std::string uri) override;
    boost::asio::awaitable<boost::json::value> GetPrompt(std::string name,
                                                         boost::json::object arguments) override;

    CapabilitySet Capabilities() const override;
    std::vector<Tool> Tools() const override;
    std::vector<Resource> Resources() const override;
    std::vector<Prompt> Prompts() const override;

    boost::asio::awaitable<void> Close() override;
    bool IsClosed() const override;
    std::size_t InFlight() const override;

    RoutingTable Routing() const;
    std::map<std::string, std::string> BackendSessionIds() const;
    std::vector<std::string> ConnectedBackends() const;
    std::map<std::string, std::string> FailedBackends() const;

    // Periodically pings every backend that supports it until Close().
    void StartKeepalive(std::chrono::milliseconds interval);

   private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace switchboard::core
