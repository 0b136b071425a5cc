#pragma once

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "ICapabilityAggregator.hpp"
#include "Session.hpp"

namespace switchboard::core {

struct SessionFactoryConfig {
    std::size_t max_concurrency = 10;  // backends initialized at once
    std::chrono::milliseconds backend_timeout{5000};
    std::chrono::milliseconds creation_timeout{30000};
    std::chrono::milliseconds keepalive_interval{0};  // 0 disables keepalive
    RecoveryConfig recovery;
};

/**
 * @brief Builds populated sessions.
 *
 * Initializes one connection per requested backend in parallel, bounded by
 * max_concurrency. Each backend gets min(backend_timeout, time left before
 * creation_timeout). Backends that fail are logged and left out; the result
 * is a Session even when every backend failed.
 */
class SessionFactory {
   public:
    SessionFactory(SessionFactoryConfig cfg, std::shared_ptr<IConnectionFactory> connector,
                   std::shared_ptr<ICredentialResolver> resolver,
                   std::shared_ptr<ICapabilityAggregator> aggregator,
                   std::shared_ptr<ISessionObserver> observer = nullptr);

    boost::asio::awaitable<std::shared_ptr<Session>> MakeSession(
        std::string id, Identity identity, std::vector<BackendTarget> backends);

    const SessionFactoryConfig& config() const noexcept { return cfg_; }

   private:
    SessionFactoryConfig cfg_;
    std::shared_ptr<IConnectionFactory> connector_;
    std::shared_ptr<ICredentialResolver> resolver_;
    std::shared_ptr<ICapabilityAggregator> aggregator_;
    std::shared_ptr<ISessionObserver> observer_;
};

}  // namespace switchboard::core
