#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "ISessionHooks.hpp"
#include "SessionRegistry.hpp"

namespace switchboard::network {

// What the HTTP layer writes back for one MCP request.
struct McpResponse {
    boost::beast::http::status status = boost::beast::http::status::ok;
    std::optional<boost::json::value> body;  // none: 202/200 without payload
    std::string session_id;                  // sent as Mcp-Session-Id when set
    std::optional<std::chrono::seconds> retry_after;
};

/**
 * @brief JSON-RPC front end for MCP clients.
 *
 * @details
 * Drives the session lifecycle hooks: an `initialize` without a session id
 * runs Generate() then OnRegisterSession(); every other request must carry
 * the id, which is validated before dispatch. Operations are served from
 * what the session registered in SessionRegistry.
 */
class McpHandler {
   public:
    McpHandler(std::shared_ptr<core::ISessionHooks> hooks,
               std::shared_ptr<SessionRegistry> registry);

    boost::asio::awaitable<McpResponse> HandlePost(std::string body, std::string session_id,
                                                   core::Identity identity);

    boost::asio::awaitable<McpResponse> HandleDelete(std::string session_id);

   private:
    boost::asio::awaitable<McpResponse> Initialize(boost::json::value id, core::Identity identity);

    // std::nullopt for methods this server does not implement.
    boost::asio::awaitable<std::optional<boost::json::value>> Dispatch(
        const std::string& method, const boost::json::object& params,
        const core::SessionRegistrations& regs);

    std::shared_ptr<core::ISessionHooks> hooks_;
    std::shared_ptr<SessionRegistry> registry_;
};

// JSON-RPC error reply for a switchboard error code, with the matching HTTP status.
McpResponse ErrorReply(const boost::json::value& id, const boost::system::error_code& ec,
                       const std::string& message);

}  // namespace switchboard::network
