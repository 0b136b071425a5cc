#include "IoContextPool.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace switchboard::infra {

namespace {

constexpr auto DRAIN_POLL = std::chrono::milliseconds(10);

}  // namespace

IoContextPool::IoContextPool(std::size_t pool_size) {
    if (pool_size == 0) {
        throw std::invalid_argument("IoContextPool needs at least one thread");
    }
    workers_.reserve(pool_size);
    for (std::size_t i = 0; i < pool_size; ++i) {
        workers_.push_back(std::make_unique<Worker>());
    }
}

IoContextPool::~IoContextPool() {
    stop();
    threads_.clear();  // jthread joins
}

void IoContextPool::run() {
    if (!threads_.empty()) {
        return;
    }

    spdlog::info("Starting I/O pool with {} thread(s).", workers_.size());

    for (std::size_t i = 0; i < workers_.size(); ++i) {
        Worker* w = workers_[i].get();
        threads_.emplace_back([w, i]() {
            try {
                w->ioc.run();
            } catch (const std::exception& e) {
                spdlog::critical("I/O worker {} terminated: {}", i, e.what());
            }
            w->finished = true;
        });
    }
}

bool IoContextPool::drain(std::chrono::milliseconds grace) {
    for (auto& w : workers_) {
        w->guard.reset();
    }

    const auto deadline = std::chrono::steady_clock::now() + grace;
    auto all_finished = [this] {
        for (const auto& w : workers_) {
            if (!w->finished) {
                return false;
            }
        }
        return true;
    };

    while (!threads_.empty() && !all_finished()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::warn("I/O pool still busy after {}ms, stopping it.", grace.count());
            stop();
            return false;
        }
        std::this_thread::sleep_for(DRAIN_POLL);
    }
    return true;
}

void IoContextPool::stop() {
    for (auto& w : workers_) {
        w->guard.reset();
        if (!w->ioc.stopped()) {
            w->ioc.stop();
        }
    }
}

asio::io_context& IoContextPool::get_io_context() {
    const std::size_t idx = next_.fetch_add(1, std::memory_order_relaxed) % workers_.size();
    return workers_[idx]->ioc;
}

}  // namespace switchboard::infra
