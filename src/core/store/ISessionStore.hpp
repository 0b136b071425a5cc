#pragma once

#include <boost/asio/awaitable.hpp>
#include <functional>
#include <optional>
#include <string>

#include "SessionMetadata.hpp"

namespace switchboard::core {

/**
 * @brief Pluggable, TTL-based persistence for session metadata.
 *
 * Backends may be process-local or replicated; SessionManager behaves the
 * same with either. The store never sees live connection objects.
 */
class ISessionStore {
   public:
    // Called for each record whose TTL ran out, before the record is removed.
    using EvictionHandler = std::function<boost::asio::awaitable<void>(std::string id)>;

    virtual ~ISessionStore() = default;

    // Inserts or replaces the record.
    virtual boost::asio::awaitable<void> Add(std::string id, SessionMetadata metadata) = 0;

    // Returns the record and extends its TTL; std::nullopt when unknown or expired.
    virtual boost::asio::awaitable<std::optional<SessionMetadata>> Get(std::string id) = 0;

    virtual boost::asio::awaitable<void> Delete(std::string id) = 0;

    virtual void SetEvictionHandler(EvictionHandler handler) = 0;
};

}  // namespace switchboard::core
