#include "Router.hpp"

#include <spdlog/spdlog.h>

#include <boost/url/parse.hpp>
#include <optional>
#include <stdexcept>
#include <string>

#include "JsonRpcRequestFactory.hpp"
#include "Types.hpp"

namespace switchboard::network {

namespace {

std::string SessionHeader(const req_t& req) {
    auto it = req.find(JsonRpcRequestFactory::kSessionHeader);
    return it == req.end() ? std::string{} : std::string(it->value());
}

}  // namespace

Router::Router(std::shared_ptr<McpHandler> mcp, std::shared_ptr<IncomingAuth> auth,  // NOLINT
               std::shared_ptr<core::SessionManager> sessions,
               std::shared_ptr<core::SessionTelemetry> telemetry, std::string endpoint)
    : mcp_(std::move(mcp)),
      auth_(std::move(auth)),
      sessions_(std::move(sessions)),
      telemetry_(std::move(telemetry)),
      endpoint_(std::move(endpoint)) {}

asio::awaitable<void> Router::RouteQuery(const req_t& req, res_t& res) {
    std::optional<std::string> failure;
    http::status status = http::status::internal_server_error;

    try {
        const auto target = req.target();
        auto url = boost::urls::parse_origin_form(std::string_view(target.data(), target.size()));
        if (!url) {
            throw std::invalid_argument("Invalid request target");
        }
        std::string path(url->path());  // NOLINT

        if (path == endpoint_ && req.method() == http::verb::post) {
            co_await handle_mcp_post(req, res);
        } else if (path == endpoint_ && req.method() == http::verb::delete_) {
            co_await handle_mcp_delete(req, res);
        } else if (path == endpoint_) {
            // No server-initiated stream is offered on GET.
            ResponseBuilder::build_error_response(res, "Method not allowed", req.version(),
                                                  req.keep_alive(),
                                                  http::status::method_not_allowed);
            res.set(http::field::allow, "POST, DELETE, OPTIONS");
        } else if (path == "/health" && req.method() == http::verb::get) {
            handle_health(req, res);
        } else if (path == "/metrics" && req.method() == http::verb::get) {
            handle_metrics(req, res);
        } else {
            throw std::out_of_range("Route not found");
        }
    } catch (const std::invalid_argument& e) {
        failure = e.what();
        status = http::status::bad_request;
    } catch (const std::out_of_range& e) {
        failure = e.what();
        status = http::status::not_found;
    } catch (const std::exception& e) {
        failure = e.what();
    }

    if (failure) {
        spdlog::error("Routing Error: {}", *failure);
        const int rpc_code = status == http::status::internal_server_error ? -32603 : -32600;
        ResponseBuilder::build_error_response(res, *failure, req.version(), req.keep_alive(),
                                              status, rpc_code);
    }
}

asio::awaitable<void> Router::handle_mcp_post(const req_t& req, res_t& res) {
    auto identity = auth_->Authenticate(std::string(req[http::field::authorization]));
    if (!identity) {
        ResponseBuilder::build_error_response(res, "Missing or invalid bearer token",
                                              req.version(), req.keep_alive(),
                                              http::status::unauthorized, -32001);
        res.set(http::field::www_authenticate, "Bearer");
        co_return;
    }

    auto reply = co_await mcp_->HandlePost(req.body(), SessionHeader(req), std::move(*identity));
    write_mcp_response(req, res, std::move(reply));
}

asio::awaitable<void> Router::handle_mcp_delete(const req_t& req, res_t& res) {
    auto reply = co_await mcp_->HandleDelete(SessionHeader(req));
    write_mcp_response(req, res, std::move(reply));
}

void Router::handle_health(const req_t& req, res_t& res) {
    json::object body;
    body["status"] = "ok";
    body["active_sessions"] = sessions_->ActiveCount();
    ResponseBuilder::make_json_response(res, http::status::ok, body, req.version(),
                                        req.keep_alive());
}

void Router::handle_metrics(const req_t& req, res_t& res) {
    ResponseBuilder::make_json_response(res, http::status::ok, telemetry_->Snapshot(),
                                        req.version(), req.keep_alive());
}

void Router::write_mcp_response(const req_t& req, res_t& res, McpResponse reply) {
    if (reply.body) {
        ResponseBuilder::make_json_response(res, reply.status, *reply.body, req.version(),
                                            req.keep_alive());
    } else {
        ResponseBuilder::build_empty_response(res, reply.status, req.version(), req.keep_alive());
    }
    if (!reply.session_id.empty()) {
        res.set(JsonRpcRequestFactory::kSessionHeader, reply.session_id);
    }
    if (reply.retry_after) {
        res.set(http::field::retry_after, std::to_string(reply.retry_after->count()));
    }
}

}  // namespace switchboard::network
