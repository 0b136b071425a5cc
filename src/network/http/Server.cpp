#include "Server.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio.hpp>
#include <boost/asio/use_future.hpp>
#include <chrono>
#include <future>

#include "CapabilityAggregator.hpp"
#include "CredentialResolver.hpp"
#include "HttpConnectionFactory.hpp"
#include "IoContextPool.hpp"
#include "Listener.hpp"
#include "McpHandler.hpp"
#include "MemorySessionStore.hpp"
#include "Router.hpp"
#include "SessionRegistry.hpp"
#include "Types.hpp"

namespace switchboard::network {

namespace {
constexpr auto SHUTDOWN_GRACE = std::chrono::seconds(15);
// Idle keep-alive connections hold their worker until this runs out.
constexpr auto POOL_DRAIN_GRACE = std::chrono::milliseconds(2000);
}

struct Server::Impl {
    asio::io_context& main_io_;
    AppConfig cfg_;

    // Components
    std::shared_ptr<infra::IoContextPool> pool_;
    std::shared_ptr<core::SessionTelemetry> telemetry_;
    std::shared_ptr<core::MemorySessionStore> store_;
    std::shared_ptr<SessionRegistry> registry_;
    std::shared_ptr<core::SessionManager> sessions_;
    std::shared_ptr<Router> router_;
    std::shared_ptr<Listener> listener_;

    Impl(asio::io_context& io, AppConfig cfg) : main_io_(io), cfg_(std::move(cfg)) {
        // 1. Thread Pool
        pool_ = std::make_shared<infra::IoContextPool>(cfg_.server.threads);

        // 2. Session core and its collaborators
        telemetry_ = std::make_shared<core::SessionTelemetry>();
        store_ = std::make_shared<core::MemorySessionStore>(cfg_.store.ttl);
        registry_ = std::make_shared<SessionRegistry>();

        auto factory = std::make_shared<core::SessionFactory>(
            cfg_.factory, std::make_shared<HttpConnectionFactory>(),
            std::make_shared<core::ConfiguredCredentialResolver>(),
            std::make_shared<core::CapabilityAggregator>(cfg_.aggregation, cfg_.backends),
            telemetry_);

        sessions_ = std::make_shared<core::SessionManager>(cfg_.sessions, factory, store_,
                                                           registry_, cfg_.backends);

        // 3. Request Routing
        auto auth = std::make_shared<IncomingAuth>(IncomingAuth::ParseMode(cfg_.incoming_auth));
        router_ = std::make_shared<Router>(std::make_shared<McpHandler>(sessions_, registry_),
                                           auth, sessions_, telemetry_, cfg_.server.endpoint);

        // 4. HTTP Listener
        tcp::endpoint endpoint{asio::ip::make_address(cfg_.server.address), cfg_.server.port};
        HttpLimits limits;
        limits.idle_timeout = cfg_.server.idle_timeout;
        limits.request_timeout = cfg_.server.request_timeout;
        limits.max_body_bytes = cfg_.server.max_body_bytes;
        limits.max_requests = cfg_.server.max_requests_per_connection;
        listener_ = std::make_shared<Listener>(main_io_, *pool_, endpoint, router_, limits);

        spdlog::info("Server initialized on {}:{}{} (Threads: {}, backends: {})",
                     cfg_.server.address, cfg_.server.port, cfg_.server.endpoint,
                     cfg_.server.threads, cfg_.backends.size());
    }

    void Start() {
        pool_->run();  // Start worker threads
        store_->StartSweeper(pool_->get_io_context().get_executor(),
                             std::chrono::duration_cast<std::chrono::milliseconds>(
                                 cfg_.store.sweep_interval));
        listener_->run();  // Start accepting connections
        main_io_.run();    // Start main thread loop
    }

    void Stop() {
        spdlog::info("Stopping server components...");
        listener_->stop();

        // Sessions close on the pool, which must still be running.
        auto done = asio::co_spawn(pool_->get_io_context(), sessions_->ShutdownAll(),
                                   asio::use_future);
        if (done.wait_for(SHUTDOWN_GRACE) != std::future_status::ready) {
            spdlog::warn("Sessions did not close within {}s.", SHUTDOWN_GRACE.count());
        } else {
            try {
                done.get();
            } catch (const std::exception& e) {
                spdlog::error("Session shutdown failed: {}", e.what());
            }
        }

        store_->Stop();
        if (!pool_->drain(POOL_DRAIN_GRACE)) {
            spdlog::warn("Dropped in-flight client connections at shutdown.");
        }
        main_io_.stop();
    }
};

Server::Server(asio::io_context& io, AppConfig cfg)
    : pImpl_(std::make_unique<Impl>(io, std::move(cfg))) {}

Server::~Server() = default;

void Server::Start() { pImpl_->Start(); }
void Server::Stop() { pImpl_->Stop(); }

}  // namespace switchboard::network
