#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <memory>

#include "HttpSession.hpp"
#include "IoContextPool.hpp"
#include "Router.hpp"
#include "Types.hpp"

namespace switchboard::network {

/**
 * @brief The TCP Connection Acceptor.
 * @details
 * **Architecture: One Acceptor, Many Workers**
 * - Runs on the main io_context to accept incoming TCP connections.
 * - **Load Balancing:** each accepted socket is bound to the next worker
 *   `io_context` of the pool, round-robin.
 * - **Handover:** the `HttpSession` for that socket runs on the worker, so
 *   request parsing and backend fan-out never touch the acceptor thread.
 */
class Listener : public std::enable_shared_from_this<Listener> {
   public:
    /**
     * @throws boost::system::system_error when the endpoint cannot be bound.
     */
    Listener(asio::io_context& ioc, infra::IoContextPool& pool, const tcp::endpoint& endpoint,
             const std::shared_ptr<Router>& router, const HttpLimits& limits);

    // Start accepting incoming connections
    void run();

    // Stop accepting; established connections are not affected.
    void stop();

   private:
    asio::awaitable<void> do_accept();

    tcp::acceptor acceptor_;
    infra::IoContextPool& pool_;
    std::shared_ptr<Router> router_;
    HttpLimits limits_;
};

}  // namespace switchboard::network
