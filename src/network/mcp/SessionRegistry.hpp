#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "ISessionHooks.hpp"

namespace switchboard::network {

// Operations registered per client session, as served by tools/list and friends.
class SessionRegistry : public core::ICapabilityRegistrar {
   public:
    using Entry = std::shared_ptr<const core::SessionRegistrations>;

    void RegisterSession(const std::string& session_id, core::SessionRegistrations regs) override;
    void UnregisterSession(const std::string& session_id) override;

    // nullptr when the session has nothing registered.
    Entry Find(const std::string& session_id) const;

    std::size_t size() const;

   private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> sessions_;
};

}  // namespace switchboard::network
