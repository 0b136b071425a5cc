#pragma once

#include <boost/asio/io_context.hpp>
#include <memory>

#include "config.hpp"

namespace switchboard::network {

/**
 * @brief High-level Server Facade.
 * Wires the session core to its collaborators and orchestrates the thread
 * pool, the session store sweeper, the listener and routing components.
 */
class Server : public std::enable_shared_from_this<Server> {
   public:
    Server(boost::asio::io_context& io, AppConfig cfg);
    ~Server();

    // Blocks running the acceptor loop until Stop().
    void Start();

    // Terminates every live session, then stops the pool and the acceptor.
    void Stop();

   private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace switchboard::network
