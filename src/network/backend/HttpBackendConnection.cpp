#include "HttpBackendConnection.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <sstream>

#include "Errors.hpp"
#include "Types.hpp"

namespace switchboard::network {

namespace {

// Large enough for any capability listing; a reply above it is a backend bug.
constexpr std::uint64_t MAX_REPLY_BYTES = 64ULL * 1024 * 1024;

// Guards against a backend that never stops returning a cursor.
constexpr int MAX_PAGES = 1000;

constexpr std::int64_t METHOD_NOT_FOUND = -32601;

bool IdMatches(const json::value& v, std::int64_t id) {
    if (v.is_int64()) {
        return v.get_int64() == id;
    }
    if (v.is_uint64()) {
        return id >= 0 && v.get_uint64() == static_cast<std::uint64_t>(id);
    }
    return false;
}

std::int64_t ErrorCode(const json::object& error) {
    if (const auto* code = error.if_contains("code"); code && code->is_int64()) {
        return code->get_int64();
    }
    return 0;
}

std::string ErrorMessage(const json::object& error) {
    if (const auto* msg = error.if_contains("message"); msg && msg->is_string()) {
        return std::string(msg->get_string());
    }
    return "unknown error";
}

template <typename Stream>
asio::awaitable<http::response<http::string_body>> Transact(Stream& stream,
                                                           http::request<http::string_body>& req) {
    co_await http::async_write(stream, req, asio::use_awaitable);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_REPLY_BYTES);
    co_await http::async_read(stream, buffer, parser, asio::use_awaitable);
    co_return parser.release();
}

}  // namespace

std::optional<json::object> FindEventStreamReply(const std::string& body, std::int64_t id) {
    std::istringstream in(body);
    std::string line;
    std::string data;

    auto try_event = [&]() -> std::optional<json::object> {
        if (data.empty()) {
            return std::nullopt;
        }
        boost::system::error_code ec;
        auto v = json::parse(data, ec);
        data.clear();
        if (ec || !v.is_object()) {
            return std::nullopt;
        }
        auto& obj = v.as_object();
        const auto* msg_id = obj.if_contains("id");
        if (msg_id && IdMatches(*msg_id, id) &&
            (obj.contains("result") || obj.contains("error"))) {
            return std::move(obj);
        }
        return std::nullopt;
    };

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            if (auto reply = try_event()) {
                return reply;
            }
            continue;
        }
        if (line.starts_with("data:")) {
            auto payload = line.substr(5);
            if (!payload.empty() && payload.front() == ' ') {
                payload.erase(0, 1);
            }
            if (!data.empty()) {
                data += '\n';
            }
            data += payload;
        }
    }
    return try_event();
}

HttpBackendConnection::HttpBackendConnection(asio::any_io_executor ex,
                                             std::shared_ptr<asio::ssl::context> tls,
                                             core::BackendTarget target,
                                             std::optional<core::Credential> credential)
    : ex_(std::move(ex)),
      tls_(std::move(tls)),
      target_(std::move(target)),
      endpoint_(JsonRpcRequestFactory::ParseEndpoint(target_.url)),
      credential_(std::move(credential)) {}

std::string HttpBackendConnection::BackendSessionId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_token_;
}

void HttpBackendConnection::Fail(const std::string& what) const {
    Throw(errc::backend_unavailable, "backend '" + target_.id + "': " + what);
}

// ============================================================================
// Transport
// ============================================================================

asio::awaitable<HttpBackendConnection::Response> HttpBackendConnection::Exchange(Request req) {
    tcp::resolver resolver(ex_);
    auto results = co_await resolver.async_resolve(endpoint_.host, endpoint_.port,
                                                   asio::use_awaitable);

    if (!endpoint_.tls) {
        beast::tcp_stream stream(ex_);
        stream.expires_after(target_.request_timeout);
        co_await stream.async_connect(results, asio::use_awaitable);

        auto res = co_await Transact(stream, req);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return res;
    }

    if (!tls_) {
        Fail("TLS endpoint configured but no TLS context available");
    }
    beast::ssl_stream<beast::tcp_stream> stream(ex_, *tls_);

    // SNI is required by most TLS-terminating proxies.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
        throw boost::system::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()),
            "SNI");
    }
    stream.set_verify_mode(asio::ssl::verify_peer);
    stream.set_verify_callback(asio::ssl::host_name_verification(endpoint_.host));

    beast::get_lowest_layer(stream).expires_after(target_.request_timeout);
    co_await beast::get_lowest_layer(stream).async_connect(results, asio::use_awaitable);
    co_await stream.async_handshake(asio::ssl::stream_base::client, asio::use_awaitable);

    auto res = co_await Transact(stream, req);

    // Many servers drop the connection without close_notify; not an error here.
    auto [ec] = co_await stream.async_shutdown(asio::as_tuple(asio::use_awaitable));
    if (ec && ec != asio::ssl::error::stream_truncated) {
        spdlog::debug("TLS shutdown with '{}': {}", target_.id, ec.message());
    }
    co_return res;
}

asio::awaitable<HttpBackendConnection::Response> HttpBackendConnection::Send(Request req,
                                                                              bool carries_token) {
    std::string failure;
    Response res;
    try {
        res = co_await Exchange(std::move(req));
    } catch (const boost::system::system_error& e) {
        if (e.code() == asio::error::operation_aborted) {
            throw;  // cancelled by a caller deadline
        }
        failure = e.what();
    }
    if (!failure.empty()) {
        Fail(failure);
    }

    const auto status = res.result_int();
    if (status == 404 && carries_token) {
        Throw(errc::backend_session_expired,
              "backend '" + target_.id + "' no longer knows its session");
    }
    if (status == 401 || status == 403) {
        Throw(errc::authorization_failed,
              "backend '" + target_.id + "' rejected the credential (HTTP " +
                  std::to_string(status) + ")");
    }
    if (status < 200 || status >= 300) {
        Fail("HTTP " + std::to_string(status));
    }
    co_return res;
}

// ============================================================================
// JSON-RPC
// ============================================================================

asio::awaitable<HttpBackendConnection::Reply> HttpBackendConnection::Call(std::string method,
                                                                          json::object params) {
    const auto id = next_id_.fetch_add(1);
    const auto token = BackendSessionId();
    auto req = JsonRpcRequestFactory::MakePost(
        endpoint_, JsonRpcRequestFactory::MakeRequest(id, method, std::move(params)), token,
        credential_);

    auto res = co_await Send(std::move(req), !token.empty());

    Reply reply;
    if (auto it = res.find(JsonRpcRequestFactory::kSessionHeader); it != res.end()) {
        reply.session_header = std::string(it->value());
    }

    const auto content_type = std::string(res[http::field::content_type]);
    if (content_type.find("text/event-stream") != std::string::npos) {
        auto message = FindEventStreamReply(res.body(), id);
        if (!message) {
            Fail("no reply to '" + method + "' in event stream");
        }
        reply.message = std::move(*message);
        co_return reply;
    }

    boost::system::error_code ec;
    auto body = json::parse(res.body(), ec);
    if (ec || !body.is_object()) {
        Fail("malformed reply to '" + method + "'");
    }
    reply.message = std::move(body.as_object());
    co_return reply;
}

asio::awaitable<json::value> HttpBackendConnection::Invoke(std::string method,
                                                           json::object params) {
    auto reply = co_await Call(method, std::move(params));
    if (const auto* error = reply.message.if_contains("error"); error && error->is_object()) {
        Fail("'" + method + "' failed (" + std::to_string(ErrorCode(error->get_object())) +
             "): " + ErrorMessage(error->get_object()));
    }
    if (auto* result = reply.message.if_contains("result")) {
        co_return std::move(*result);
    }
    Fail("reply to '" + method + "' has neither result nor error");
}

asio::awaitable<void> HttpBackendConnection::Notify(std::string method) {
    auto token = BackendSessionId();
    auto req = JsonRpcRequestFactory::MakePost(
        endpoint_, JsonRpcRequestFactory::MakeNotification(method), token, credential_);
    co_await Send(std::move(req), !token.empty());
}

template <typename T>
asio::awaitable<std::vector<T>> HttpBackendConnection::ListAll(std::string method,
                                                               std::string key) {
    std::vector<T> items;
    std::string cursor;

    for (int page = 0; page < MAX_PAGES; ++page) {
        json::object params;
        if (!cursor.empty()) {
            params["cursor"] = cursor;
        }

        auto reply = co_await Call(method, std::move(params));
        if (const auto* error = reply.message.if_contains("error"); error && error->is_object()) {
            if (ErrorCode(error->get_object()) == METHOD_NOT_FOUND) {
                // The backend does not offer this kind of capability.
                co_return items;
            }
            Fail("'" + method + "' failed: " + ErrorMessage(error->get_object()));
        }

        const auto* result = reply.message.if_contains("result");
        if (!result || !result->is_object()) {
            Fail("reply to '" + method + "' has no result");
        }
        const auto& obj = result->get_object();
        if (const auto* list = obj.if_contains(key); list && list->is_array()) {
            for (const auto& v : list->get_array()) {
                items.push_back(json::value_to<T>(v));
            }
        }

        cursor.clear();
        if (const auto* next = obj.if_contains("nextCursor"); next && next->is_string()) {
            cursor = std::string(next->get_string());
        }
        if (cursor.empty()) {
            co_return items;
        }
    }

    spdlog::warn("Backend '{}' paginated '{}' past {} pages, truncating.", target_.id, method,
                 MAX_PAGES);
    co_return items;
}

// ============================================================================
// IBackendConnection
// ============================================================================

asio::awaitable<void> HttpBackendConnection::Initialize() {
    json::object client_info;
    client_info["name"] = "switchboard";
    client_info["version"] = "1.0.0";

    json::object params;
    params["protocolVersion"] = JsonRpcRequestFactory::kProtocolVersion;
    params["capabilities"] = json::object{};
    params["clientInfo"] = std::move(client_info);

    auto reply = co_await Call("initialize", std::move(params));
    if (const auto* error = reply.message.if_contains("error"); error && error->is_object()) {
        Fail("initialize rejected: " + ErrorMessage(error->get_object()));
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_token_ = std::move(reply.session_header);
    }

    co_await Notify("notifications/initialized");
    spdlog::debug("Backend '{}' initialized (session '{}').", target_.id, BackendSessionId());
}

asio::awaitable<std::vector<core::Tool>> HttpBackendConnection::ListTools() {
    return ListAll<core::Tool>("tools/list", "tools");
}

asio::awaitable<std::vector<core::Resource>> HttpBackendConnection::ListResources() {
    return ListAll<core::Resource>("resources/list", "resources");
}

asio::awaitable<std::vector<core::Prompt>> HttpBackendConnection::ListPrompts() {
    return ListAll<core::Prompt>("prompts/list", "prompts");
}

asio::awaitable<json::value> HttpBackendConnection::CallTool(std::string name,
                                                             json::object arguments) {
    json::object params;
    params["name"] = std::move(name);
    params["arguments"] = std::move(arguments);
    return Invoke("tools/call", std::move(params));
}

asio::awaitable<json::value> HttpBackendConnection::ReadResource(std::string uri) {
    json::object params;
    params["uri"] = std::move(uri);
    return Invoke("resources/read", std::move(params));
}

asio::awaitable<json::value> HttpBackendConnection::GetPrompt(std::string name,
                                                              json::object arguments) {
    json::object params;
    params["name"] = std::move(name);
    params["arguments"] = std::move(arguments);
    return Invoke("prompts/get", std::move(params));
}

asio::awaitable<void> HttpBackendConnection::Ping() {
    auto reply = co_await Call("ping", {});
    const auto* error = reply.message.if_contains("error");
    if (!error || !error->is_object()) {
        co_return;
    }
    if (ErrorCode(error->get_object()) == METHOD_NOT_FOUND) {
        spdlog::info("Backend '{}' does not support ping, keepalive disabled.", target_.id);
        keepalive_supported_.store(false);
        co_return;
    }
    Fail("ping failed: " + ErrorMessage(error->get_object()));
}

asio::awaitable<void> HttpBackendConnection::Close() {
    if (closed_.exchange(true)) {
        co_return;
    }
    const auto token = BackendSessionId();
    if (token.empty()) {
        co_return;  // stateless backend, nothing to end
    }

    std::string failure;
    Response res;
    try {
        res = co_await Exchange(JsonRpcRequestFactory::MakeDelete(endpoint_, token, credential_));
    } catch (const boost::system::system_error& e) {
        failure = e.what();
    }
    if (!failure.empty()) {
        Fail("closing session: " + failure);
    }

    const auto status = res.result_int();
    // 405: backend does not let clients end sessions. 404: already gone.
    if ((status >= 200 && status < 300) || status == 405 || status == 404) {
        spdlog::debug("Backend '{}' session '{}' closed.", target_.id, token);
        co_return;
    }
    Fail("closing session: HTTP " + std::to_string(status));
}

}  // namespace switchboard::network
