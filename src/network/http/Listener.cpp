#include "Listener.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "HttpSession.hpp"

namespace switchboard::network {

namespace {

// Report a failure
void fail(beast::error_code ec, const char* what) {
    if (ec != beast::errc::not_connected && ec != asio::error::eof &&
        ec != asio::error::connection_reset) {
        spdlog::error("{} : {}", what, ec.message());
    }
}

}  // namespace

Listener::Listener(asio::io_context& main_ioc, infra::IoContextPool& pool,
                   const tcp::endpoint& endpoint, const std::shared_ptr<Router>& router,
                   const HttpLimits& limits)
    : acceptor_(main_ioc), pool_(pool), router_(router), limits_(limits) {
    acceptor_.open(endpoint.protocol());

    // SO_REUSEADDR lets a restarted process bind while the old socket sits in TIME_WAIT.
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);

    spdlog::debug("Listener successfully bound to {} {} ", endpoint.address().to_string(),
                  endpoint.port());
}

void Listener::run() {
    spdlog::debug("Starting to accept connections.. ");

    // fire and forget coroutine and continue listening
    asio::co_spawn(
        acceptor_.get_executor(), [self = shared_from_this()]() { return self->do_accept(); },
        asio::detached);
}

void Listener::stop() {
    asio::post(acceptor_.get_executor(), [self = shared_from_this()] {
        beast::error_code ec;
        self->acceptor_.close(ec);
    });
}

asio::awaitable<void> Listener::do_accept() {
    try {
        for (;;) {
            // The future connection lives on a worker io_context.
            auto& pool_ioc = pool_.get_io_context();

            auto [ec, socket] =
                co_await acceptor_.async_accept(pool_ioc, asio::as_tuple(asio::use_awaitable));

            if (ec) {
                if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                    break;
                }
                fail(ec, "accept");
                continue;
            }

            std::make_shared<HttpSession>(std::move(socket), router_, limits_)->run();
        }
    } catch (const std::exception& e) {
        spdlog::error("[Listener] Uncaught exception: {}", e.what());
    }
}

}  // namespace switchboard::network
