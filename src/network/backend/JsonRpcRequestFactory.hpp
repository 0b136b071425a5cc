#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

#include "Identity.hpp"

namespace switchboard::network {

// Where a backend lives, parsed once from its configured URL.
struct Endpoint {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target = "/";
    bool tls = false;

    // Value of the Host header.
    std::string authority() const;
};

// Builds the MCP streamable-HTTP messages sent to backends.
namespace JsonRpcRequestFactory {

inline constexpr const char* kProtocolVersion = "2025-03-26";
inline constexpr const char* kSessionHeader = "Mcp-Session-Id";

/**
 * @brief Parses an http(s) URL.
 * @throws boost::system::system_error on malformed or unsupported URLs.
 */
Endpoint ParseEndpoint(const std::string& url);

boost::json::object MakeRequest(std::int64_t id, const std::string& method,
                                boost::json::object params);
boost::json::object MakeNotification(const std::string& method, boost::json::object params = {});

// POST carrying one JSON-RPC message. Empty session_token omits the header.
boost::beast::http::request<boost::beast::http::string_body> MakePost(
    const Endpoint& endpoint, const boost::json::object& message,
    const std::string& session_token, const std::optional<core::Credential>& credential);

// DELETE ending the backend session identified by session_token.
boost::beast::http::request<boost::beast::http::string_body> MakeDelete(
    const Endpoint& endpoint, const std::string& session_token,
    const std::optional<core::Credential>& credential);

}  // namespace JsonRpcRequestFactory

}  // namespace switchboard::network
