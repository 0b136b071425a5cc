#include "Session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <shared_mutex>

#include "AsyncLatch.hpp"
#include "Backoff.hpp"
#include "Deadline.hpp"
#include "Errors.hpp"
#include "Types.hpp"

namespace switchboard::core {

namespace {

enum class OperationKind { tool, resource, prompt };

std::string_view to_string(OperationKind kind) {
    switch (kind) {
        case OperationKind::tool:
            return "tool";
        case OperationKind::resource:
            return "resource";
        case OperationKind::prompt:
            return "prompt";
    }
    return "operation";
}

// Performs one attempt of a routed call, given the backend-side name.
using BackendCall =
    std::function<asio::awaitable<json::value>(IBackendConnection&, const std::string&)>;

}  // namespace

// =========================================================
//  Session Implementation (PIMPL)
// =========================================================

struct Session::Impl {
    // Recovery bookkeeping per backend. The map holding these is built once in
    // the constructor and never rehashed, so lookups need no lock.
    struct BackendHealth {
        BackendHealth(const RecoveryConfig& cfg)
            : breaker(cfg.breaker), backoff(cfg.backoff_initial, cfg.backoff_max) {}

        CircuitBreaker breaker;
        Backoff backoff;  // touched only by the leader of a re-init flight
    };

    // Concurrent failures on one backend share a single re-initialization.
    struct ReinitFlight {
        explicit ReinitFlight(asio::any_io_executor ex) : done(std::move(ex), 1) {}

        infra::AsyncLatch done;
        BackendConnectionPtr connection;
        std::exception_ptr error;
        bool abandoned = false;  // the leader was cancelled, followers elect a new one
    };

    // Settles a breaker admission; an unsettled one is released on scope exit.
    struct TrialGuard {
        CircuitBreaker& breaker;
        bool settled = false;

        void Succeed() {
            breaker.RecordSuccess();
            settled = true;
        }
        void Fail() {
            breaker.RecordFailure();
            settled = true;
        }
        ~TrialGuard() {
            if (!settled) {
                breaker.ReleaseTrial();
            }
        }
    };

    struct Target {
        RoutingEntry entry;
        BackendConnectionPtr connection;
    };

    asio::any_io_executor ex_;
    const std::string id_;
    const Identity identity_;
    std::unordered_map<std::string, BackendTarget> targets_;
    const std::map<std::string, std::string> init_failures_;
    const std::map<std::string, std::string> failed_prefixes_;
    SessionDeps deps_;

    // Guarded by mutex_.
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, BackendConnectionPtr> connections_;
    std::map<std::string, std::string> backend_session_ids_;
    RoutingTable routing_;
    CapabilitySet caps_;
    std::atomic<bool> closed_{false};

    std::atomic<std::size_t> in_flight_{0};
    infra::AsyncLatch drained_;

    std::unordered_map<std::string, std::unique_ptr<BackendHealth>> health_;

    std::mutex reinit_mutex_;
    std::unordered_map<std::string, std::shared_ptr<ReinitFlight>> reinit_;

    std::mutex keepalive_mutex_;
    std::shared_ptr<asio::steady_timer> keepalive_timer_;

    Impl(asio::any_io_executor ex, SessionParts parts, SessionDeps deps)
        : ex_(ex),
          id_(std::move(parts.id)),
          identity_(std::move(parts.identity)),
          init_failures_(std::move(parts.init_failures)),
          failed_prefixes_(std::move(parts.failed_prefixes)),
          deps_(std::move(deps)),
          connections_(std::move(parts.connections)),
          routing_(std::move(parts.aggregation.routing)),
          caps_(std::move(parts.aggregation.capabilities)),
          drained_(ex, 1) {
        for (auto& t : parts.targets) {
            health_.emplace(t.id, std::make_unique<BackendHealth>(deps_.recovery));
            targets_.emplace(t.id, std::move(t));
        }
        for (const auto& [backend, conn] : connections_) {
            backend_session_ids_[backend] = conn->BackendSessionId();
        }
        spdlog::debug("Session [{}] populated with {} backend(s), {} tool(s).", id_,
                      connections_.size(), caps_.tools.size());
    }

    // ---------------------------------------------------------
    //  In-flight accounting
    // ---------------------------------------------------------

    struct InFlightGuard {
        Impl& impl;
        ~InFlightGuard() { impl.Leave(); }
    };

    void Leave() {
        if (in_flight_.fetch_sub(1) == 1 && closed_.load()) {
            drained_.CountDown();
        }
    }

    const std::unordered_map<std::string, RoutingEntry>& TableFor(OperationKind kind) const {
        switch (kind) {
            case OperationKind::resource:
                return routing_.resources;
            case OperationKind::prompt:
                return routing_.prompts;
            case OperationKind::tool:
                break;
        }
        return routing_.tools;
    }

    // A name carrying the prefix of a backend that never came up, such as
    // "db_query" when "db" failed to initialize.
    const std::string* FailedBackendFor(const std::string& name) const {
        for (const auto& [backend, prefix] : failed_prefixes_) {
            if (!prefix.empty() && name.size() > prefix.size() && name.starts_with(prefix)) {
                return &backend;
            }
        }
        return nullptr;
    }

    // Resolves the route and registers the call as in flight, atomically with
    // respect to Close(). The lock is released before any I/O.
    Target Acquire(OperationKind kind, const std::string& name) {
        std::shared_lock lock(mutex_);
        if (closed_.load()) {
            Throw(errc::session_closed, "session " + id_ + " is closed");
        }

        const auto& table = TableFor(kind);
        auto route = table.find(name);
        if (route == table.end()) {
            if (const auto* backend = FailedBackendFor(name)) {
                Throw(errc::backend_unavailable,
                      "backend '" + *backend + "' is unavailable: " + init_failures_.at(*backend));
            }
            if (connections_.empty()) {
                Throw(errc::no_backends_available, "no backends available in session " + id_);
            }
            Throw(errc::operation_not_found,
                  std::string(to_string(kind)) + " '" + name + "' not found");
        }

        auto conn = connections_.find(route->second.backend_id);
        if (conn == connections_.end()) {
            Throw(errc::backend_unavailable,
                  "backend '" + route->second.backend_id + "' is not connected");
        }

        in_flight_.fetch_add(1);
        return Target{route->second, conn->second};
    }

    // ---------------------------------------------------------
    //  Routed calls
    // ---------------------------------------------------------

    asio::awaitable<json::value> Invoke(OperationKind kind, std::string name, BackendCall call) {
        auto target = Acquire(kind, name);
        InFlightGuard guard{*this};

        const auto started = Clock::now();
        std::exception_ptr failure;
        json::value result;
        try {
            result = co_await DispatchWithRecovery(target, call);
        } catch (...) {
            failure = std::current_exception();
        }

        if (deps_.observer) {
            deps_.observer->OnOperationCompleted(
                id_, target.entry.backend_id,
                std::string(to_string(kind)) + ":" + target.entry.exposed_name,
                std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - started),
                failure == nullptr);
        }
        if (failure) {
            std::rethrow_exception(failure);
        }
        co_return result;
    }

    static asio::awaitable<void> ThrowIfCancelled() {
        auto state = co_await asio::this_coro::cancellation_state;
        if (state.cancelled() != asio::cancellation_type::none) {
            throw boost::system::system_error(asio::error::operation_aborted, "call cancelled");
        }
    }

    asio::awaitable<json::value> DispatchWithRecovery(const Target& target,
                                                      const BackendCall& call) {
        const auto& backend = target.entry.backend_id;
        auto conn = target.connection;

        const auto& health = *health_.at(backend);

        for (std::size_t attempt = 0;; ++attempt) {
            co_await ThrowIfCancelled();
            if (health.breaker.IsOpen()) {
                Throw(errc::circuit_open, "backend '" + backend + "' is failing, retry later");
            }

            std::optional<errc> recoverable;
            std::string reason;
            try {
                co_return co_await call(*conn, target.entry.original_name);
            } catch (const boost::system::system_error& e) {
                const bool expired = Is(e.code(), errc::backend_session_expired);
                const bool rejected = Is(e.code(), errc::authorization_failed);
                if (!(expired || rejected) || attempt >= deps_.recovery.max_retries) {
                    throw;
                }
                recoverable = expired ? errc::backend_session_expired : errc::authorization_failed;
                reason = e.what();
            }

            spdlog::warn("Session [{}] backend '{}' failed a call ({}), recovering.", id_, backend,
                         reason);
            conn = co_await Recover(backend, conn, *recoverable, reason);
        }
    }

    // ---------------------------------------------------------
    //  Re-initialization
    // ---------------------------------------------------------

    asio::awaitable<BackendConnectionPtr> Recover(const std::string& backend,
                                                  BackendConnectionPtr failed, errc kind,
                                                  std::string reason) {
        for (;;) {
            std::shared_ptr<ReinitFlight> flight;
            bool leader = false;
            {
                std::lock_guard lock(reinit_mutex_);
                {
                    std::shared_lock read(mutex_);
                    auto current = connections_.find(backend);
                    if (current != connections_.end() && current->second != failed) {
                        // Someone already replaced the connection this call used.
                        co_return current->second;
                    }
                }
                auto& slot = reinit_[backend];
                if (!slot) {
                    slot = std::make_shared<ReinitFlight>(ex_);
                    leader = true;
                }
                flight = slot;
            }

            if (!leader) {
                co_await flight->done.Wait();
                if (flight->abandoned) {
                    continue;
                }
                if (flight->error) {
                    std::rethrow_exception(flight->error);
                }
                co_return flight->connection;
            }

            std::exception_ptr error;
            try {
                flight->connection = co_await Recreate(backend, failed, kind, std::move(reason));
            } catch (const boost::system::system_error& e) {
                flight->abandoned = e.code() == asio::error::operation_aborted;
                error = std::current_exception();
            } catch (...) {
                error = std::current_exception();
            }
            if (!flight->abandoned) {
                flight->error = error;
            }
            {
                std::lock_guard lock(reinit_mutex_);
                reinit_.erase(backend);
            }
            flight->done.CountDown();

            if (error) {
                std::rethrow_exception(error);
            }
            co_return flight->connection;
        }
    }

    // Builds a replacement first, then swaps it in and closes the stale one,
    // so a failed attempt leaves the previous connection in place.
    asio::awaitable<BackendConnectionPtr> Recreate(const std::string& backend,
                                                   BackendConnectionPtr stale, errc kind,
                                                   std::string reason) {
        auto& health = *health_.at(backend);
        if (!health.breaker.AllowRequest()) {
            Throw(errc::circuit_open, "recovery suspended for backend '" + backend + "'");
        }
        TrialGuard trial{health.breaker};
        if (kind == errc::authorization_failed) {
            co_await WaitAsync(health.backoff.Next());
        }

        const auto& target = targets_.at(backend);
        BackendConnectionPtr fresh;
        std::string failure;
        bool cancelled = false;
        try {
            auto credential = co_await deps_.resolver->Resolve(identity_, target);
            fresh = deps_.connector->Create(ex_, target, std::move(credential));
            co_await infra::WithDeadline(fresh->Initialize(), Clock::now() + deps_.backend_timeout);
        } catch (const boost::system::system_error& e) {
            cancelled = e.code() == asio::error::operation_aborted;
            failure = e.what();
        } catch (const std::exception& e) {
            failure = e.what();
        }

        if (cancelled) {
            // Cancellation releases the trial without recording a failure.
            if (fresh) {
                co_await CloseQuietly(backend, fresh);
            }
            throw boost::system::system_error(asio::error::operation_aborted, "call cancelled");
        }
        if (!failure.empty()) {
            trial.Fail();
            spdlog::error("Session [{}] re-initialization of backend '{}' failed: {}", id_,
                          backend, failure);
            if (fresh) {
                co_await CloseQuietly(backend, fresh);
            }
            Throw(errc::backend_unavailable,
                  "re-initialization of backend '" + backend + "' failed: " + failure);
        }

        trial.Succeed();
        health.backoff.Reset();
        {
            std::unique_lock lock(mutex_);
            connections_[backend] = fresh;
            backend_session_ids_[backend] = fresh->BackendSessionId();
        }

        co_await CloseQuietly(backend, stale);

        if (deps_.observer) {
            deps_.observer->OnBackendReinitialized(id_, backend, reason);
        }
        co_return fresh;
    }

    // For connections the session no longer routes to.
    asio::awaitable<void> CloseQuietly(const std::string& backend, BackendConnectionPtr conn) {
        try {
            co_await conn->Close();
        } catch (const std::exception& e) {
            spdlog::debug("Session [{}] closing replaced connection to '{}': {}", id_, backend,
                          e.what());
        }
    }

    // ---------------------------------------------------------
    //  Keepalive
    // ---------------------------------------------------------

    asio::awaitable<void> KeepaliveRound() {
        std::vector<std::pair<std::string, BackendConnectionPtr>> probes;
        {
            std::shared_lock lock(mutex_);
            if (closed_.load()) {
                co_return;
            }
            for (const auto& [backend, conn] : connections_) {
                if (targets_.at(backend).keepalive && conn->SupportsKeepalive()) {
                    probes.emplace_back(backend, conn);
                }
            }
            in_flight_.fetch_add(1);
        }
        InFlightGuard guard{*this};

        for (auto& [backend, conn] : probes) {
            bool expired = false;
            try {
                co_await infra::WithDeadline(conn->Ping(), Clock::now() + deps_.backend_timeout);
            } catch (const boost::system::system_error& e) {
                expired = Is(e.code(), errc::backend_session_expired);
                spdlog::warn("Session [{}] keepalive to '{}' failed: {}", id_, backend, e.what());
            }
            if (!expired) {
                continue;
            }

            std::string failure;
            try {
                co_await Recover(backend, conn, errc::backend_session_expired, "keepalive");
            } catch (const std::exception& e) {
                failure = e.what();
            }
            if (!failure.empty()) {
                spdlog::warn("Session [{}] keepalive recovery of '{}' failed: {}", id_, backend,
                             failure);
            }
        }
    }

    void StopKeepalive() {
        std::shared_ptr<asio::steady_timer> timer;
        {
            std::lock_guard lock(keepalive_mutex_);
            timer = std::move(keepalive_timer_);
        }
        if (timer) {
            asio::post(timer->get_executor(), [timer] { timer->cancel(); });
        }
    }

    // ---------------------------------------------------------
    //  Shutdown
    // ---------------------------------------------------------

    asio::awaitable<void> Close() {
        {
            std::unique_lock lock(mutex_);
            if (closed_.load()) {
                co_return;
            }
            closed_.store(true);
        }
        spdlog::debug("Session [{}] closing, {} call(s) in flight.", id_, in_flight_.load());

        StopKeepalive();
        if (in_flight_.load() > 0) {
            co_await drained_.Wait();
        }

        std::unordered_map<std::string, BackendConnectionPtr> to_close;
        {
            std::unique_lock lock(mutex_);
            to_close.swap(connections_);
        }

        std::vector<std::string> failures;
        for (auto& [backend, conn] : to_close) {
            try {
                co_await conn->Close();
            } catch (const std::exception& e) {
                failures.push_back(backend + ": " + e.what());
            }
        }

        if (deps_.observer) {
            deps_.observer->OnSessionClosed(id_);
        }
        if (!failures.empty()) {
            spdlog::warn("Session [{}] closed with {} connection error(s).", id_, failures.size());
            throw SessionCloseError(std::move(failures));
        }
        spdlog::info("Session [{}] closed.", id_);
    }
};

// =========================================================
//  Public API
// =========================================================

Session::Session(asio::any_io_executor ex, SessionParts parts, SessionDeps deps)
    : pImpl_(std::make_unique<Impl>(std::move(ex), std::move(parts), std::move(deps))) {}

Session::~Session() = default;

const std::string& Session::Id() const { return pImpl_->id_; }

asio::awaitable<json::value> Session::CallTool(std::string name, json::object arguments) {
    return pImpl_->Invoke(OperationKind::tool, std::move(name),
                          [args = std::move(arguments)](IBackendConnection& conn,
                                                        const std::string& original) {
                              return conn.CallTool(original, args);
                          });
}

asio::awaitable<json::value> Session::ReadResource(std::string uri) {
    return pImpl_->Invoke(OperationKind::resource, std::move(uri),
                          [](IBackendConnection& conn, const std::string& original) {
                              return conn.ReadResource(original);
                          });
}

asio::awaitable<json::value> Session::GetPrompt(std::string name, json::object arguments) {
    return pImpl_->Invoke(OperationKind::prompt, std::move(name),
                          [args = std::move(arguments)](IBackendConnection& conn,
                                                        const std::string& original) {
                              return conn.GetPrompt(original, args);
                          });
}

CapabilitySet Session::Capabilities() const {
    std::shared_lock lock(pImpl_->mutex_);
    return pImpl_->caps_;
}

std::vector<Tool> Session::Tools() const {
    std::shared_lock lock(pImpl_->mutex_);
    return pImpl_->caps_.tools;
}

std::vector<Resource> Session::Resources() const {
    std::shared_lock lock(pImpl_->mutex_);
    return pImpl_->caps_.resources;
}

std::vector<Prompt> Session::Prompts() const {
    std::shared_lock lock(pImpl_->mutex_);
    return pImpl_->caps_.prompts;
}

asio::awaitable<void> Session::Close() { return pImpl_->Close(); }

bool Session::IsClosed() const { return pImpl_->closed_.load(); }

std::size_t Session::InFlight() const { return pImpl_->in_flight_.load(); }

RoutingTable Session::Routing() const {
    std::shared_lock lock(pImpl_->mutex_);
    return pImpl_->routing_;
}

std::map<std::string, std::string> Session::BackendSessionIds() const {
    std::shared_lock lock(pImpl_->mutex_);
    return pImpl_->backend_session_ids_;
}

std::vector<std::string> Session::ConnectedBackends() const {
    std::shared_lock lock(pImpl_->mutex_);
    std::vector<std::string> ids;
    ids.reserve(pImpl_->connections_.size());
    for (const auto& [backend, conn] : pImpl_->connections_) {
        ids.push_back(backend);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::map<std::string, std::string> Session::FailedBackends() const {
    return pImpl_->init_failures_;
}

void Session::StartKeepalive(std::chrono::milliseconds interval) {
    if (interval.count() <= 0 || IsClosed()) {
        return;
    }
    auto timer = std::make_shared<asio::steady_timer>(pImpl_->ex_);
    {
        std::lock_guard lock(pImpl_->keepalive_mutex_);
        pImpl_->keepalive_timer_ = timer;
    }

    asio::co_spawn(
        pImpl_->ex_,
        [weak = weak_from_this(), timer, interval]() -> asio::awaitable<void> {
            for (;;) {
                timer->expires_after(interval);
                auto [ec] = co_await timer->async_wait(asio::as_tuple(asio::use_awaitable));
                if (ec) {
                    co_return;
                }
                auto self = weak.lock();
                if (!self || self->IsClosed()) {
                    co_return;
                }
                co_await self->pImpl_->KeepaliveRound();
            }
        },
        [id = pImpl_->id_](std::exception_ptr e) {
            if (!e) {
                return;
            }
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                spdlog::error("Session [{}] keepalive loop stopped: {}", id, ex.what());
            }
        });
    spdlog::debug("Session [{}] keepalive every {} ms.", pImpl_->id_, interval.count());
}

}  // namespace switchboard::core
