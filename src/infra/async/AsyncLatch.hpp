#pragma once

#include <atomic>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <cstddef>

#include "Types.hpp"

namespace switchboard::infra {

/**
 * @brief Single-use countdown latch for coroutines.
 *
 * Waiters suspend until the count reaches zero. Once open the latch stays open.
 * CountDown() and Wait() may be called from any thread of the pool: the
 * wake-up is a close() on a concurrent channel, and a closed channel completes
 * receives immediately, so a CountDown() racing with Wait() is never lost.
 */
class AsyncLatch {
   public:
    AsyncLatch(asio::any_io_executor ex, std::size_t count)
        : count_(count), channel_(std::move(ex)) {
        if (count == 0) {
            channel_.close();
        }
    }

    AsyncLatch(const AsyncLatch&) = delete;
    AsyncLatch& operator=(const AsyncLatch&) = delete;

    // Extra calls after the latch opened are ignored.
    void CountDown() {
        auto current = count_.load();
        while (current > 0) {
            if (count_.compare_exchange_weak(current, current - 1)) {
                if (current == 1) {
                    channel_.close();
                }
                return;
            }
        }
    }

    bool Ready() const noexcept { return count_.load() == 0; }

    asio::awaitable<void> Wait() {
        if (Ready()) {
            co_return;
        }
        auto [ec] = co_await channel_.async_receive(asio::as_tuple(asio::use_awaitable));
        if (ec && ec != asio::experimental::error::channel_closed) {
            // Cancellation of the waiting coroutine.
            throw boost::system::system_error(ec, "latch wait");
        }
    }

   private:
    std::atomic<std::size_t> count_;
    asio::experimental::concurrent_channel<void(boost::system::error_code)> channel_;
};

}  // namespace switchboard::infra
