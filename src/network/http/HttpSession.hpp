#pragma once

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include "Router.hpp"
#include "Types.hpp"

namespace switchboard::network {

struct HttpLimits {
    std::chrono::seconds idle_timeout{60};
    // Covers routing, which may wait on session creation against slow backends.
    std::chrono::seconds request_timeout{120};
    std::uint64_t max_body_bytes = 10ULL * 1024 * 1024;
    unsigned int max_requests = 0;  // per connection, 0 means unlimited
};

/**
 * @brief Handles a single client connection.
 * Serves keep-alive requests one after another until the peer closes, the
 * idle timeout fires, the request cap is reached or a response without
 * keep-alive has been written. Oversized and malformed requests are answered
 * before the connection is closed.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
   public:
    HttpSession(tcp::socket&& socket, std::shared_ptr<Router> router, const HttpLimits& limits);

    // Entry point: launches the session coroutine
    void run();

   private:
    asio::awaitable<void> do_session();
    asio::awaitable<void> do_graceful_close();

    // I/O helpers
    asio::awaitable<beast::error_code> do_read_request();
    asio::awaitable<beast::error_code> do_write_response(http::response<http::string_body>& res);

    asio::awaitable<http::response<http::string_body>> do_build_response();

    // Reply for a request that could not be read, or nullopt when the peer is gone.
    std::optional<http::response<http::string_body>> reject_unreadable(beast::error_code ec) const;

    bool is_options_request() const;
    void do_close();

    beast::tcp_stream stream_;
    std::shared_ptr<Router> router_;
    HttpLimits limits_;
    beast::flat_buffer buffer_;
    std::string peer_;
    unsigned int served_ = 0;

    // Reset per request, required for keep-alive
    std::optional<http::request_parser<http::string_body>> parser_;
};

}  // namespace switchboard::network
