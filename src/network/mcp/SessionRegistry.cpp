#include "SessionRegistry.hpp"

#include <spdlog/spdlog.h>

namespace switchboard::network {

void SessionRegistry::RegisterSession(const std::string& session_id,
                                      core::SessionRegistrations regs) {
    auto entry = std::make_shared<const core::SessionRegistrations>(std::move(regs));
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session_id] = std::move(entry);
    spdlog::debug("[{}] Registered operations with the front end.", session_id);
}

void SessionRegistry::UnregisterSession(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_id);
}

SessionRegistry::Entry SessionRegistry::Find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace switchboard::network
