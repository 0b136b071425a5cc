#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>

#include "AsyncLatch.hpp"
#include "Types.hpp"

namespace switchboard::infra {

/**
 * @brief Runs task(0) .. task(count - 1) concurrently with at most `limit`
 * of them in flight, and resumes once all of them finished.
 *
 * `limit` worker coroutines are spawned on the caller's executor; each pulls
 * the next index until none remain. Tasks are expected to handle their own
 * failures; an exception escaping a task is logged and ends that worker only.
 */
template <typename Task>
asio::awaitable<void> RunBounded(std::size_t count, std::size_t limit, Task task) {
    if (count == 0) {
        co_return;
    }

    auto ex = co_await asio::this_coro::executor;
    const std::size_t workers = std::min(count, std::max<std::size_t>(limit, 1));

    auto next = std::make_shared<std::atomic<std::size_t>>(0);
    auto done = std::make_shared<AsyncLatch>(ex, workers);
    auto shared_task = std::make_shared<Task>(std::move(task));

    for (std::size_t w = 0; w < workers; ++w) {
        asio::co_spawn(
            ex,
            [next, count, shared_task]() -> asio::awaitable<void> {
                for (;;) {
                    const std::size_t idx = next->fetch_add(1);
                    if (idx >= count) {
                        break;
                    }
                    co_await (*shared_task)(idx);
                }
            },
            [done](std::exception_ptr ep) {
                if (ep) {
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        spdlog::error("Bounded worker terminated: {}", e.what());
                    }
                }
                done->CountDown();
            });
    }

    co_await done->Wait();
}

}  // namespace switchboard::infra
