#pragma once

#include <algorithm>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>

namespace switchboard::core {

// Exponential backoff state for connection recreation.
struct Backoff {
    std::chrono::milliseconds initial{100};
    std::chrono::milliseconds max{2000};
    std::chrono::milliseconds current = initial;

    Backoff() = default;
    Backoff(std::chrono::milliseconds initial_delay, std::chrono::milliseconds max_delay)
        : initial(initial_delay), max(max_delay), current(initial_delay) {}

    void Reset() { current = initial; }

    std::chrono::milliseconds Next() {
        auto v = current;
        current = std::min(max, current * 2);
        return v;
    }
};

inline boost::asio::awaitable<void> WaitAsync(std::chrono::milliseconds delay) {
    if (delay.count() <= 0) {
        co_return;
    }
    boost::asio::steady_timer t(co_await boost::asio::this_coro::executor);
    t.expires_after(delay);
    co_await t.async_wait(boost::asio::use_awaitable);
}

}  // namespace switchboard::core
