#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "Types.hpp"

namespace switchboard::infra {

/**
 * @brief Worker threads for client connections and backend I/O, one
 * `io_context` per thread.
 *
 * Connections are spread over the contexts round-robin; everything a
 * connection spawns (session creation, backend calls, keepalive) stays on the
 * context it was accepted on.
 */
class IoContextPool {
   public:
    explicit IoContextPool(std::size_t pool_size);

    // Forces a stop if drain() was never called; joins every worker.
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    void run();

    /**
     * @brief Lets pending work finish, then stops.
     * Releases the work guards so each context returns once its queue is empty.
     * Contexts still busy after `grace` are stopped; their handlers are dropped.
     * @return true when every context finished on its own.
     */
    bool drain(std::chrono::milliseconds grace);

    // Stops every context immediately.
    void stop();

    asio::io_context& get_io_context();

    std::size_t size() const noexcept { return workers_.size(); }

   private:
    struct Worker {
        asio::io_context ioc;
        asio::executor_work_guard<asio::io_context::executor_type> guard{ioc.get_executor()};
        std::atomic<bool> finished{false};
    };

    std::vector<std::unique_ptr<Worker>> workers_;
    std::vector<std::jthread> threads_;
    std::atomic<std::size_t> next_{0};
};

}  // namespace switchboard::infra
