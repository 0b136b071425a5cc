#pragma once

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "ISessionHooks.hpp"
#include "ISessionStore.hpp"
#include "SessionFactory.hpp"

namespace switchboard::core {

struct SessionManagerConfig {
    std::size_t max_sessions = 1000;  // placeholders count against the cap
    std::chrono::seconds retry_after{5};
};

/**
 * @brief Owns the live sessions of this process and implements the
 * front end's lifecycle hooks.
 *
 * @details
 * Creation is two-phase. Generate() reserves a slot under the cap, stores a
 * placeholder record and returns the new id. OnRegisterSession() builds the
 * session through SessionFactory, swaps it in for the placeholder and
 * registers its operations with the front end.
 *
 * Metadata lives in the session store; the store's eviction handler closes
 * the live session before the record disappears. Live sessions are kept in a
 * local map, never in the store.
 */
class SessionManager : public ISessionHooks {
   public:
    using Decorator = std::function<SessionPtr(SessionPtr)>;
    using IdGenerator = std::function<std::string()>;

    SessionManager(SessionManagerConfig cfg, std::shared_ptr<SessionFactory> factory,
                   std::shared_ptr<ISessionStore> store,
                   std::shared_ptr<ICapabilityRegistrar> registrar,
                   std::vector<BackendTarget> backends);

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Applied to every session right after it is populated.
    void SetDecorator(Decorator decorator);
    void SetIdGenerator(IdGenerator generator);

    /**
     * @brief Phase 1. Issues a fresh id backed by a placeholder record.
     * @throws SessionLimitExceeded when max_sessions are active or pending.
     */
    boost::asio::awaitable<std::string> Generate() override;

    /**
     * @brief Phase 2. Populates the session issued by Generate().
     * @throws boost::system::system_error (session_not_found) when the id is
     * not pending, for example because it was terminated meanwhile.
     */
    boost::asio::awaitable<void> OnRegisterSession(std::string id, Identity identity) override;

    boost::asio::awaitable<bool> Validate(std::string id) override;

    // Closes the live session (draining in-flight calls), then deletes the record.
    boost::asio::awaitable<void> Terminate(std::string id) override;

    /**
     * @brief Live session for id; refreshes its TTL.
     *
     * The HTTP front end never calls this: it dispatches through the handlers
     * registered with ICapabilityRegistrar. It serves code that embeds the
     * manager directly, such as decorators installed in-process and tests.
     * @throws boost::system::system_error (session_not_found).
     */
    boost::asio::awaitable<SessionPtr> GetSession(std::string id);

    boost::asio::awaitable<void> ShutdownAll();

    std::size_t ActiveCount() const;

   private:
    SessionRegistrations BuildRegistrations(const SessionPtr& session) const;

    // Detaches and closes the live session; leaves the store untouched.
    boost::asio::awaitable<void> CloseLive(const std::string& id);

    SessionManagerConfig cfg_;
    std::shared_ptr<SessionFactory> factory_;
    std::shared_ptr<ISessionStore> store_;
    std::shared_ptr<ICapabilityRegistrar> registrar_;
    std::vector<BackendTarget> backends_;

    Decorator decorator_;
    IdGenerator next_id_;

    mutable std::mutex mutex_;
    std::unordered_set<std::string> pending_;
    std::unordered_map<std::string, SessionPtr> live_;
};

}  // namespace switchboard::core
