#pragma once

#include <boost/json.hpp>
#include <chrono>
#include <string>

namespace switchboard::core {

/**
 * @brief Persisted part of a session. Never holds connections or routing
 * data: those wrap live network state and stay in the owning process.
 */
struct SessionMetadata {
    std::string id;
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point last_touched_at{};
    std::string identity_reference;  // empty while the session is a placeholder

    bool is_placeholder() const noexcept { return identity_reference.empty(); }

    // Fresh record stamped with the current time.
    static SessionMetadata MakePlaceholder(std::string session_id);
};

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const SessionMetadata& m);
SessionMetadata tag_invoke(boost::json::value_to_tag<SessionMetadata>, const boost::json::value& jv);

}  // namespace switchboard::core
