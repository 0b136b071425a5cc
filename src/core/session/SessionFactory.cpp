#include "SessionFactory.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <unordered_set>

#include "BoundedParallel.hpp"
#include "Deadline.hpp"
#include "Errors.hpp"

namespace switchboard::core {

SessionFactory::SessionFactory(SessionFactoryConfig cfg,
                               std::shared_ptr<IConnectionFactory> connector,
                               std::shared_ptr<ICredentialResolver> resolver,
                               std::shared_ptr<ICapabilityAggregator> aggregator,
                               std::shared_ptr<ISessionObserver> observer)
    : cfg_(std::move(cfg)),
      connector_(std::move(connector)),
      resolver_(std::move(resolver)),
      aggregator_(std::move(aggregator)),
      observer_(std::move(observer)) {
    if (cfg_.max_concurrency == 0) {
        cfg_.max_concurrency = 1;
    }
}

asio::awaitable<std::shared_ptr<Session>> SessionFactory::MakeSession(
    std::string id, Identity identity, std::vector<BackendTarget> backends) {
    auto ex = co_await asio::this_coro::executor;
    const auto creation_deadline = Clock::now() + cfg_.creation_timeout;

    // Duplicate ids would make two connections compete for one map slot.
    {
        std::unordered_set<std::string> seen;
        auto last = std::remove_if(backends.begin(), backends.end(), [&](const BackendTarget& b) {
            if (seen.insert(b.id).second) {
                return false;
            }
            spdlog::warn("[{}] Backend '{}' requested twice, ignoring the duplicate.", id, b.id);
            return true;
        });
        backends.erase(last, backends.end());
    }

    spdlog::info("[{}] Creating session with {} backend(s) for '{}'.", id, backends.size(),
                 identity.subject);

    std::vector<BackendConnectionPtr> created(backends.size());
    std::vector<std::optional<std::string>> failures(backends.size());

    co_await infra::RunBounded(
        backends.size(), cfg_.max_concurrency, [&](std::size_t i) -> asio::awaitable<void> {
            const auto& target = backends[i];
            const auto started = Clock::now();
            const auto deadline = std::min(started + cfg_.backend_timeout, creation_deadline);

            BackendConnectionPtr conn;
            try {
                if (started >= creation_deadline) {
                    Throw(errc::deadline_exceeded, "session creation deadline passed");
                }
                auto credential =
                    co_await infra::WithDeadline(resolver_->Resolve(identity, target), deadline);
                conn = connector_->Create(ex, target, std::move(credential));
                co_await infra::WithDeadline(conn->Initialize(), deadline);
                created[i] = conn;
            } catch (const std::exception& e) {
                failures[i] = e.what();
            }

            const auto latency =
                std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - started);
            if (observer_) {
                observer_->OnBackendInitialized(id, target.id, latency, !failures[i]);
            }
            if (!failures[i]) {
                spdlog::debug("[{}] Backend '{}' initialized in {} us.", id, target.id,
                              latency.count());
                co_return;
            }

            spdlog::warn("[{}] Backend '{}' failed to initialize: {}", id, target.id,
                         *failures[i]);
            if (conn) {
                // Half-open handshake; release whatever the backend allocated.
                std::optional<std::string> close_error;
                try {
                    co_await conn->Close();
                } catch (const std::exception& e) {
                    close_error = e.what();
                }
                if (close_error) {
                    spdlog::debug("[{}] Closing failed backend '{}': {}", id, target.id,
                                  *close_error);
                }
            }
        });

    SessionParts parts;
    parts.id = id;
    parts.identity = std::move(identity);

    std::vector<BackendConnectionPtr> connected;
    for (std::size_t i = 0; i < backends.size(); ++i) {
        if (created[i]) {
            connected.push_back(created[i]);
            parts.connections.emplace(backends[i].id, created[i]);
        } else {
            parts.init_failures.emplace(backends[i].id, failures[i].value_or("unknown error"));
            parts.failed_prefixes.emplace(backends[i].id, aggregator_->NamePrefix(backends[i].id));
        }
    }

    if (!connected.empty()) {
        std::optional<std::string> aggregation_error;
        try {
            parts.aggregation = co_await aggregator_->Aggregate(connected);
        } catch (const std::exception& e) {
            aggregation_error = e.what();
        }
        if (aggregation_error) {
            // Connections stay; the session simply exposes nothing from them.
            spdlog::error("[{}] Capability aggregation failed: {}", id, *aggregation_error);
            parts.aggregation = AggregationResult{};
        }
    } else if (!backends.empty()) {
        spdlog::warn("[{}] Every backend failed to initialize; session has no backends.", id);
    }

    parts.targets = std::move(backends);
    const auto connected_count = parts.connections.size();

    SessionDeps deps{connector_, resolver_, observer_, cfg_.recovery, cfg_.backend_timeout};
    auto session = std::make_shared<Session>(ex, std::move(parts), std::move(deps));

    if (observer_) {
        observer_->OnSessionCreated(id, connected_count);
    }
    session->StartKeepalive(cfg_.keepalive_interval);
    co_return session;
}

}  // namespace switchboard::core
