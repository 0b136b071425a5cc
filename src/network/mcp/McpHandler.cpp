#include "McpHandler.hpp"

#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "JsonRpcRequestFactory.hpp"
#include "Types.hpp"

namespace switchboard::network {

namespace {

constexpr std::int64_t PARSE_ERROR = -32700;
constexpr std::int64_t METHOD_NOT_FOUND = -32601;
constexpr std::int64_t INTERNAL_ERROR = -32603;

json::object Envelope(const json::value& id) {
    json::object msg;
    msg["jsonrpc"] = "2.0";
    msg["id"] = id;
    return msg;
}

McpResponse RpcError(const json::value& id, std::int64_t code, const std::string& message,
                     http::status status, json::value data = nullptr) {
    json::object error;
    error["code"] = code;
    error["message"] = message;
    if (!data.is_null()) {
        error["data"] = std::move(data);
    }

    auto msg = Envelope(id);
    msg["error"] = std::move(error);

    McpResponse res;
    res.status = status;
    res.body = std::move(msg);
    return res;
}

McpResponse Result(const json::value& id, json::value result) {
    auto msg = Envelope(id);
    msg["result"] = std::move(result);

    McpResponse res;
    res.body = std::move(msg);
    return res;
}

McpResponse Rejected(const json::value& id, errc e, const std::string& message) {
    return ErrorReply(id, make_error_code(e), message);
}

std::string RequireString(const json::object& params, const char* key) {
    const auto* v = params.if_contains(key);
    if (!v || !v->is_string()) {
        Throw(errc::invalid_request, std::string("missing string parameter '") + key + "'");
    }
    return std::string(v->get_string());
}

json::object OptionalObject(const json::object& params, const char* key) {
    const auto* v = params.if_contains(key);
    if (!v || v->is_null()) {
        return {};
    }
    if (!v->is_object()) {
        Throw(errc::invalid_request, std::string("parameter '") + key + "' must be an object");
    }
    return v->get_object();
}

json::object InitializeResult() {
    json::object tools;
    tools["listChanged"] = false;
    json::object resources;
    resources["subscribe"] = false;
    resources["listChanged"] = false;
    json::object prompts;
    prompts["listChanged"] = false;

    json::object capabilities;
    capabilities["tools"] = std::move(tools);
    capabilities["resources"] = std::move(resources);
    capabilities["prompts"] = std::move(prompts);

    json::object server_info;
    server_info["name"] = "switchboard";
    server_info["version"] = "1.0.0";

    json::object result;
    result["protocolVersion"] = JsonRpcRequestFactory::kProtocolVersion;
    result["capabilities"] = std::move(capabilities);
    result["serverInfo"] = std::move(server_info);
    return result;
}

}  // namespace

McpResponse ErrorReply(const json::value& id, const boost::system::error_code& ec,
                       const std::string& message) {
    json::value data;
    if (ec.category() == category()) {
        json::object reason;
        reason["reason"] = ErrorName(static_cast<errc>(ec.value()));
        data = std::move(reason);
    }
    return RpcError(id, JsonRpcCode(ec), message, static_cast<http::status>(HttpStatus(ec)),
                    std::move(data));
}

McpHandler::McpHandler(std::shared_ptr<core::ISessionHooks> hooks,
                       std::shared_ptr<SessionRegistry> registry)
    : hooks_(std::move(hooks)), registry_(std::move(registry)) {}

asio::awaitable<McpResponse> McpHandler::HandlePost(std::string body, std::string session_id,
                                                    core::Identity identity) {
    boost::system::error_code ec;
    auto parsed = json::parse(body, ec);
    if (ec) {
        co_return RpcError(nullptr, PARSE_ERROR, "parse error", http::status::bad_request);
    }
    if (!parsed.is_object()) {
        co_return Rejected(nullptr, errc::invalid_request, "request must be a JSON object");
    }
    const auto& msg = parsed.as_object();

    const auto* method_v = msg.if_contains("method");
    if (!method_v || !method_v->is_string()) {
        co_return Rejected(nullptr, errc::invalid_request, "missing method");
    }
    const std::string method(method_v->get_string());
    const bool notification = !msg.contains("id");
    const json::value id = notification ? json::value(nullptr) : msg.at("id");

    json::object params;
    if (const auto* p = msg.if_contains("params"); p && !p->is_null()) {
        if (!p->is_object()) {
            co_return Rejected(id, errc::invalid_request, "params must be an object");
        }
        params = p->get_object();
    }

    if (method == "initialize") {
        if (!session_id.empty()) {
            co_return Rejected(id, errc::invalid_request, "session already initialized");
        }
        co_return co_await Initialize(id, std::move(identity));
    }

    if (session_id.empty()) {
        co_return Rejected(id, errc::invalid_request, "missing Mcp-Session-Id header");
    }
    if (!co_await hooks_->Validate(session_id)) {
        co_return Rejected(id, errc::session_not_found,
                           "session '" + session_id + "' not found, re-initialize");
    }
    if (notification) {
        McpResponse accepted;
        accepted.status = http::status::accepted;
        co_return accepted;
    }

    auto regs = registry_->Find(session_id);
    if (!regs) {
        co_return Rejected(id, errc::session_not_found,
                           "session '" + session_id + "' is not active");
    }

    std::optional<McpResponse> failure;
    std::optional<json::value> result;
    try {
        result = co_await Dispatch(method, params, *regs);
    } catch (const boost::system::system_error& e) {
        spdlog::debug("[{}] {} failed: {}", session_id, method, e.what());
        failure = ErrorReply(id, e.code(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("[{}] {} failed: {}", session_id, method, e.what());
        failure = RpcError(id, INTERNAL_ERROR, e.what(), http::status::internal_server_error);
    }
    if (failure) {
        co_return std::move(*failure);
    }
    if (!result) {
        co_return RpcError(id, METHOD_NOT_FOUND, "method '" + method + "' not found",
                           http::status::ok);
    }
    co_return Result(id, std::move(*result));
}

asio::awaitable<McpResponse> McpHandler::Initialize(json::value id, core::Identity identity) {
    std::optional<McpResponse> failure;

    // Phase 1: no request context.
    std::string session_id;
    try {
        session_id = co_await hooks_->Generate();
    } catch (const SessionLimitExceeded& e) {
        failure = ErrorReply(id, e.code(), "too many active sessions, retry later");
        failure->retry_after = e.retry_after();
    } catch (const std::exception& e) {
        spdlog::error("Issuing a session id failed: {}", e.what());
        failure = RpcError(id, INTERNAL_ERROR, "could not create session",
                           http::status::internal_server_error);
    }
    if (failure) {
        co_return std::move(*failure);
    }

    // Phase 2: the caller is known now.
    try {
        co_await hooks_->OnRegisterSession(session_id, std::move(identity));
    } catch (const boost::system::system_error& e) {
        failure = ErrorReply(id, e.code(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("[{}] Populating session failed: {}", session_id, e.what());
        failure = RpcError(id, INTERNAL_ERROR, "could not create session",
                           http::status::internal_server_error);
    }
    if (failure) {
        std::optional<std::string> cleanup_error;
        try {
            co_await hooks_->Terminate(session_id);
        } catch (const std::exception& e) {
            cleanup_error = e.what();
        }
        if (cleanup_error) {
            spdlog::warn("[{}] Cleanup after failed creation: {}", session_id, *cleanup_error);
        }
        co_return std::move(*failure);
    }

    auto res = Result(id, InitializeResult());
    res.session_id = session_id;
    co_return res;
}

asio::awaitable<McpResponse> McpHandler::HandleDelete(std::string session_id) {
    if (session_id.empty()) {
        co_return Rejected(nullptr, errc::invalid_request, "missing Mcp-Session-Id header");
    }
    if (!co_await hooks_->Validate(session_id)) {
        co_return Rejected(nullptr, errc::session_not_found,
                           "session '" + session_id + "' not found");
    }
    co_await hooks_->Terminate(session_id);
    co_return McpResponse{};
}

asio::awaitable<std::optional<json::value>> McpHandler::Dispatch(
    const std::string& method, const json::object& params,
    const core::SessionRegistrations& regs) {
    if (method == "ping") {
        co_return json::value(json::object{});
    }

    if (method == "tools/list") {
        json::array tools;
        for (const auto& reg : regs.tools) {
            tools.push_back(json::value_from(reg.tool));
        }
        json::object result;
        result["tools"] = std::move(tools);
        co_return json::value(std::move(result));
    }
    if (method == "tools/call") {
        auto name = RequireString(params, "name");
        auto args = OptionalObject(params, "arguments");
        for (const auto& reg : regs.tools) {
            if (reg.tool.name == name) {
                co_return co_await reg.handler(std::move(args));
            }
        }
        co_return co_await regs.unlisted_tool(std::move(name), std::move(args));
    }

    if (method == "resources/list") {
        json::array resources;
        for (const auto& reg : regs.resources) {
            resources.push_back(json::value_from(reg.resource));
        }
        json::object result;
        result["resources"] = std::move(resources);
        co_return json::value(std::move(result));
    }
    if (method == "resources/read") {
        auto uri = RequireString(params, "uri");
        for (const auto& reg : regs.resources) {
            if (reg.resource.uri == uri) {
                co_return co_await reg.handler();
            }
        }
        co_return co_await regs.unlisted_resource(std::move(uri));
    }

    if (method == "prompts/list") {
        json::array prompts;
        for (const auto& reg : regs.prompts) {
            prompts.push_back(json::value_from(reg.prompt));
        }
        json::object result;
        result["prompts"] = std::move(prompts);
        co_return json::value(std::move(result));
    }
    if (method == "prompts/get") {
        auto name = RequireString(params, "name");
        auto args = OptionalObject(params, "arguments");
        for (const auto& reg : regs.prompts) {
            if (reg.prompt.name == name) {
                co_return co_await reg.handler(std::move(args));
            }
        }
        co_return co_await regs.unlisted_prompt(std::move(name), std::move(args));
    }

    co_return std::nullopt;
}

}  // namespace switchboard::network
