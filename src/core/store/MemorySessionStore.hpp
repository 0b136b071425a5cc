#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "ISessionStore.hpp"

namespace switchboard::core {

/**
 * @brief Single-process session store.
 *
 * Expired records are invisible to Get() immediately and are evicted by a
 * sweeper coroutine: the eviction handler (which closes the live session) is
 * awaited first, the record is erased afterwards.
 */
class MemorySessionStore : public ISessionStore,
                           public std::enable_shared_from_this<MemorySessionStore> {
   public:
    explicit MemorySessionStore(std::chrono::milliseconds ttl);
    ~MemorySessionStore() override;

    MemorySessionStore(const MemorySessionStore&) = delete;
    MemorySessionStore& operator=(const MemorySessionStore&) = delete;

    boost::asio::awaitable<void> Add(std::string id, SessionMetadata metadata) override;
    boost::asio::awaitable<std::optional<SessionMetadata>> Get(std::string id) override;
    boost::asio::awaitable<void> Delete(std::string id) override;
    void SetEvictionHandler(EvictionHandler handler) override;

    // Runs SweepExpired() every `interval` on ex until Stop().
    void StartSweeper(boost::asio::any_io_executor ex, std::chrono::milliseconds interval);
    void Stop();

    // One eviction pass. Returns the number of records removed.
    boost::asio::awaitable<std::size_t> SweepExpired();

    std::size_t size() const;

   private:
    using clock = std::chrono::steady_clock;

    struct Entry {
        SessionMetadata metadata;
        clock::time_point expires_at;
    };

    std::chrono::milliseconds ttl_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    EvictionHandler on_evict_;

    std::shared_ptr<boost::asio::steady_timer> sweep_timer_;
    std::atomic<bool> stopped_{false};
};

}  // namespace switchboard::core
