#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "IBackendConnection.hpp"
#include "JsonRpcRequestFactory.hpp"

namespace switchboard::network {

/**
 * @brief Backend connection speaking MCP streamable HTTP.
 *
 * @details
 * **Transport:** every JSON-RPC message travels on its own short-lived
 * TCP (or TLS) stream, so concurrent calls never share socket state. The only
 * state that outlives a request is the backend session token captured from
 * the `Mcp-Session-Id` header during Initialize().
 *
 * **Replies:** a backend may answer with `application/json` or with a
 * `text/event-stream`; in the latter case the event whose `id` matches the
 * request is taken.
 *
 * **Errors:** HTTP 404 on a request carrying a token becomes
 * backend_session_expired, 401/403 become authorization_failed, anything else
 * (transport failures and timeouts included) becomes backend_unavailable.
 */
class HttpBackendConnection : public core::IBackendConnection {
   public:
    HttpBackendConnection(boost::asio::any_io_executor ex,
                          std::shared_ptr<boost::asio::ssl::context> tls,
                          core::BackendTarget target, std::optional<core::Credential> credential);

    const std::string& BackendId() const override { return target_.id; }
    std::string BackendSessionId() const override;

    boost::asio::awaitable<void> Initialize() override;

    boost::asio::awaitable<std::vector<core::Tool>> ListTools() override;
    boost::asio::awaitable<std::vector<core::Resource>> ListResources() override;
    boost::asio::awaitable<std::vector<core::Prompt>> ListPrompts() override;

    boost::asio::awaitable<boost::json::value> CallTool(std::string name,
                                                        boost::json::object arguments) override;
    boost::asio::awaitable<boost::json::value> ReadResource(std::string uri) override;
    boost::asio::awaitable<boost::json::value> GetPrompt(std::string name,
                                                         boost::json::object arguments) override;

    boost::asio::awaitable<void> Ping() override;
    bool SupportsKeepalive() const override { return keepalive_supported_.load(); }

    boost::asio::awaitable<void> Close() override;

   private:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    // One reply message plus the token header, when the backend sent one.
    struct Reply {
        boost::json::object message;
        std::string session_header;
    };

    boost::asio::awaitable<Reply> Call(std::string method, boost::json::object params);

    // Call() that unwraps `result` and turns a JSON-RPC error into an exception.
    boost::asio::awaitable<boost::json::value> Invoke(std::string method,
                                                      boost::json::object params);

    boost::asio::awaitable<void> Notify(std::string method);

    template <typename T>
    boost::asio::awaitable<std::vector<T>> ListAll(std::string method, std::string key);

    // Transport with status mapping.
    boost::asio::awaitable<Response> Send(Request req, bool carries_token);
    boost::asio::awaitable<Response> Exchange(Request req);

    [[noreturn]] void Fail(const std::string& what) const;

    boost::asio::any_io_executor ex_;
    std::shared_ptr<boost::asio::ssl::context> tls_;
    core::BackendTarget target_;
    Endpoint endpoint_;
    std::optional<core::Credential> credential_;

    mutable std::mutex mutex_;
    std::string session_token_;

    std::atomic<std::int64_t> next_id_{1};
    std::atomic<bool> keepalive_supported_{true};
    std::atomic<bool> closed_{false};
};

// Extracts the JSON-RPC reply with the given id from an SSE payload.
std::optional<boost::json::object> FindEventStreamReply(const std::string& body, std::int64_t id);

}  // namespace switchboard::network
