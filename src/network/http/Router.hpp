#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <string>

#include "IncomingAuth.hpp"
#include "McpHandler.hpp"
#include "SessionManager.hpp"
#include "SessionTelemetry.hpp"
#include "response_builder.hpp"

namespace switchboard::network {

using ResponseBuilder = models::ResponseBuilder;
using req_t = boost::beast::http::request<boost::beast::http::string_body>;
using res_t = boost::beast::http::response<boost::beast::http::string_body>;

/**
 * @brief Maps HTTP requests onto the MCP endpoint and the operational routes.
 *
 *   POST   <endpoint>  one JSON-RPC message
 *   DELETE <endpoint>  terminate the session named by Mcp-Session-Id
 *   GET    /health     liveness and active session count
 *   GET    /metrics    telemetry snapshot
 */
class Router {
   public:
    Router(std::shared_ptr<McpHandler> mcp, std::shared_ptr<IncomingAuth> auth,
           std::shared_ptr<core::SessionManager> sessions,
           std::shared_ptr<core::SessionTelemetry> telemetry, std::string endpoint = "/mcp");

    boost::asio::awaitable<void> RouteQuery(const req_t& req, res_t& res);

   private:
    // Handlers
    boost::asio::awaitable<void> handle_mcp_post(const req_t& req, res_t& res);
    boost::asio::awaitable<void> handle_mcp_delete(const req_t& req, res_t& res);
    void handle_health(const req_t& req, res_t& res);
    void handle_metrics(const req_t& req, res_t& res);

    static void write_mcp_response(const req_t& req, res_t& res, McpResponse reply);

    std::shared_ptr<McpHandler> mcp_;
    std::shared_ptr<IncomingAuth> auth_;
    std::shared_ptr<core::SessionManager> sessions_;
    std::shared_ptr<core::SessionTelemetry> telemetry_;
    std::string endpoint_;
};

}  // namespace switchboard::network
