#include "MemorySessionStore.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <vector>

namespace switchboard::core {

namespace asio = boost::asio;

MemorySessionStore::MemorySessionStore(std::chrono::milliseconds ttl) : ttl_(ttl) {}

MemorySessionStore::~MemorySessionStore() = default;

asio::awaitable<void> MemorySessionStore::Add(std::string id, SessionMetadata metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.insert_or_assign(std::move(id), Entry{std::move(metadata), clock::now() + ttl_});
    co_return;
}

asio::awaitable<std::optional<SessionMetadata>> MemorySessionStore::Get(std::string id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        co_return std::nullopt;
    }
    const auto now = clock::now();
    if (it->second.expires_at <= now) {
        co_return std::nullopt;
    }
    it->second.expires_at = now + ttl_;
    it->second.metadata.last_touched_at = std::chrono::system_clock::now();
    co_return it->second.metadata;
}

asio::awaitable<void> MemorySessionStore::Delete(std::string id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(id);
    co_return;
}

void MemorySessionStore::SetEvictionHandler(EvictionHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_evict_ = std::move(handler);
}

asio::awaitable<std::size_t> MemorySessionStore::SweepExpired() {
    std::vector<std::string> expired;
    EvictionHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock::now();
        for (const auto& [id, entry] : entries_) {
            if (entry.expires_at <= now) {
                expired.push_back(id);
            }
        }
        handler = on_evict_;
    }

    std::size_t removed = 0;
    for (const auto& id : expired) {
        if (handler) {
            try {
                co_await handler(id);
            } catch (const std::exception& e) {
                spdlog::error("[{}] Eviction handler failed: {}", id, e.what());
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        // Re-added while the handler ran: keep the fresh record.
        if (it != entries_.end() && it->second.expires_at <= clock::now()) {
            entries_.erase(it);
            ++removed;
        }
    }

    if (removed > 0) {
        spdlog::debug("Session store evicted {} expired record(s)", removed);
    }
    co_return removed;
}

void MemorySessionStore::StartSweeper(asio::any_io_executor ex, std::chrono::milliseconds interval) {
    if (sweep_timer_) {
        return;
    }
    sweep_timer_ = std::make_shared<asio::steady_timer>(ex);

    asio::co_spawn(
        ex,
        [self = shared_from_this(), timer = sweep_timer_, interval]() -> asio::awaitable<void> {
            while (!self->stopped_) {
                timer->expires_after(interval);
                auto [ec] = co_await timer->async_wait(asio::as_tuple(asio::use_awaitable));
                if (ec || self->stopped_) {
                    break;
                }
                co_await self->SweepExpired();
            }
            spdlog::debug("Session store sweeper stopped");
        },
        asio::detached);
}

void MemorySessionStore::Stop() {
    stopped_ = true;
    if (sweep_timer_) {
        asio::post(sweep_timer_->get_executor(), [timer = sweep_timer_]() { timer->cancel(); });
    }
}

std::size_t MemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace switchboard::core
