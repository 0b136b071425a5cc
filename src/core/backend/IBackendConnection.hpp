#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "BackendTarget.hpp"
#include "Capabilities.hpp"
#include "Identity.hpp"

namespace switchboard::core {

/**
 * @brief One initialized, stateful link to one backend.
 *
 * @details
 * Owned by exactly one Session for its whole life and never pooled. Failures
 * are reported as boost::system::system_error with switchboard codes:
 * backend_session_expired when the backend no longer knows the token from
 * Initialize(), authorization_failed when it rejects the credential, and
 * backend_unavailable for everything else.
 *
 * **Thread Safety:** implementations must accept concurrent calls.
 */
class IBackendConnection {
   public:
    virtual ~IBackendConnection() = default;

    virtual const std::string& BackendId() const = 0;

    // Token issued by the backend during Initialize(); empty before that.
    virtual std::string BackendSessionId() const = 0;

    // Session-establishment handshake.
    virtual boost::asio::awaitable<void> Initialize() = 0;

    virtual boost::asio::awaitable<std::vector<Tool>> ListTools() = 0;
    virtual boost::asio::awaitable<std::vector<Resource>> ListResources() = 0;
    virtual boost::asio::awaitable<std::vector<Prompt>> ListPrompts() = 0;

    virtual boost::asio::awaitable<boost::json::value> CallTool(std::string name,
                                                                boost::json::object arguments) = 0;
    virtual boost::asio::awaitable<boost::json::value> ReadResource(std::string uri) = 0;
    virtual boost::asio::awaitable<boost::json::value> GetPrompt(std::string name,
                                                                 boost::json::object arguments) = 0;

    // Low-cost liveness probe, only meaningful when SupportsKeepalive().
    virtual boost::asio::awaitable<void> Ping() = 0;
    virtual bool SupportsKeepalive() const = 0;

    virtual boost::asio::awaitable<void> Close() = 0;
};

using BackendConnectionPtr = std::shared_ptr<IBackendConnection>;

/**
 * @brief Creates (but does not initialize) backend connections. The session
 * core never branches on the concrete connection type.
 */
class IConnectionFactory {
   public:
    virtual ~IConnectionFactory() = default;

    virtual BackendConnectionPtr Create(boost::asio::any_io_executor ex,
                                        const BackendTarget& target,
                                        std::optional<Credential> credential) = 0;
};

}  // namespace switchboard::core
