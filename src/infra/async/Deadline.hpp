#pragma once

#include <boost/asio/experimental/awaitable_operators.hpp>
#include <exception>
#include <optional>
#include <utility>

#include "Errors.hpp"
#include "Types.hpp"

namespace switchboard::infra {

namespace detail {

// Turns a throwing awaitable into one that always completes normally, so the
// `||` race below settles on the first operation to finish rather than the
// first one to succeed.
template <typename T>
asio::awaitable<std::pair<std::optional<T>, std::exception_ptr>> Capture(asio::awaitable<T> op) {
    std::exception_ptr error;
    try {
        co_return std::make_pair(std::optional<T>(co_await std::move(op)), std::exception_ptr{});
    } catch (...) {
        error = std::current_exception();
    }
    co_return std::make_pair(std::optional<T>{}, error);
}

inline asio::awaitable<std::exception_ptr> Capture(asio::awaitable<void> op) {
    std::exception_ptr error;
    try {
        co_await std::move(op);
    } catch (...) {
        error = std::current_exception();
    }
    co_return error;
}

}  // namespace detail

/**
 * @brief Runs op, cancelling it when the deadline passes first.
 * @throws boost::system::system_error (errc::deadline_exceeded) on timeout,
 * otherwise whatever op threw.
 */
template <typename T>
asio::awaitable<T> WithDeadline(asio::awaitable<T> op, Clock::time_point deadline) {
    using namespace asio::experimental::awaitable_operators;

    asio::steady_timer timer(co_await asio::this_coro::executor, deadline);
    auto outcome =
        co_await (detail::Capture(std::move(op)) || timer.async_wait(asio::use_awaitable));

    if (outcome.index() == 1) {
        Throw(errc::deadline_exceeded, "deadline exceeded");
    }
    auto& [value, error] = std::get<0>(outcome);
    if (error) {
        std::rethrow_exception(error);
    }
    co_return std::move(*value);
}

inline asio::awaitable<void> WithDeadline(asio::awaitable<void> op, Clock::time_point deadline) {
    using namespace asio::experimental::awaitable_operators;

    asio::steady_timer timer(co_await asio::this_coro::executor, deadline);
    auto outcome =
        co_await (detail::Capture(std::move(op)) || timer.async_wait(asio::use_awaitable));

    if (outcome.index() == 1) {
        Throw(errc::deadline_exceeded, "deadline exceeded");
    }
    if (auto error = std::get<0>(outcome)) {
        std::rethrow_exception(error);
    }
}

}  // namespace switchboard::infra
