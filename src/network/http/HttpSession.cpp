#include "HttpSession.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <memory>

#include "Router.hpp"
#include "Types.hpp"

namespace {

using namespace switchboard;

constexpr int DRAIN_BUFFER_SIZE = 1024;
constexpr int DRAIN_TIMEOUT_SECONDS = 1;

bool PeerGone(const beast::error_code& ec) {
    return ec == http::error::end_of_stream || ec == asio::error::eof ||
           ec == asio::error::connection_reset || ec == beast::errc::not_connected ||
           ec == beast::error::timeout;
}

}  // namespace

namespace switchboard::network {

HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<Router> router,
                         const HttpLimits& limits)
    : stream_(std::move(socket)), router_(std::move(router)), limits_(limits) {
    beast::error_code ec;
    auto remote = stream_.socket().remote_endpoint(ec);
    peer_ = ec ? "unknown" : remote.address().to_string() + ":" + std::to_string(remote.port());
    spdlog::debug("[HttpSession] connection from {}", peer_);
}

void HttpSession::run() {
    asio::co_spawn(
        stream_.get_executor(), [self = shared_from_this()]() { return self->do_session(); },
        asio::detached);
}

asio::awaitable<void> HttpSession::do_session() {
    try {
        for (;;) {
            parser_.emplace();
            parser_->body_limit(limits_.max_body_bytes);
            stream_.expires_after(limits_.idle_timeout);

            if (auto ec = co_await do_read_request()) {
                auto reply = reject_unreadable(ec);
                if (reply) {
                    co_await do_write_response(*reply);
                    co_await do_graceful_close();
                } else if (ec == http::error::end_of_stream) {
                    co_await do_graceful_close();
                } else {
                    do_close();
                }
                co_return;
            }

            ++served_;
            const bool cap_reached =
                limits_.max_requests != 0 && served_ >= limits_.max_requests;

            stream_.expires_after(limits_.request_timeout);
            auto res = co_await do_build_response();
            if (cap_reached) {
                res.keep_alive(false);
            }

            if (auto ec = co_await do_write_response(res)) {
                if (!PeerGone(ec)) {
                    spdlog::warn("[HttpSession] write to {} failed: {}", peer_, ec.message());
                }
                do_close();
                co_return;
            }

            if (!res.keep_alive()) {
                spdlog::debug("[HttpSession] closing {} after {} request(s)", peer_, served_);
                co_await do_graceful_close();
                co_return;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("[HttpSession] connection {} died: {}", peer_, e.what());
    }
}

asio::awaitable<beast::error_code> HttpSession::do_read_request() {
    auto [ec_head, _] = co_await http::async_read_header(stream_, buffer_, *parser_,
                                                         asio::as_tuple(asio::use_awaitable));
    if (ec_head || is_options_request()) {
        co_return ec_head;
    }

    auto [ec_body, _unused] =
        co_await http::async_read(stream_, buffer_, *parser_, asio::as_tuple(asio::use_awaitable));
    co_return ec_body;
}

std::optional<http::response<http::string_body>> HttpSession::reject_unreadable(
    beast::error_code ec) const {
    if (PeerGone(ec)) {
        return std::nullopt;
    }

    http::response<http::string_body> res;
    if (ec == http::error::body_limit) {
        spdlog::warn("[HttpSession] {} sent a body above {} bytes", peer_, limits_.max_body_bytes);
        ResponseBuilder::build_error_response(res, "request body too large", 11, false,
                                              http::status::payload_too_large);
        return res;
    }
    if (ec.category() == http::make_error_code(http::error::bad_method).category()) {
        spdlog::debug("[HttpSession] malformed request from {}: {}", peer_, ec.message());
        ResponseBuilder::build_error_response(res, "malformed HTTP request", 11);
        return res;
    }
    spdlog::warn("[HttpSession] read from {} failed: {}", peer_, ec.message());
    return std::nullopt;
}

asio::awaitable<http::response<http::string_body>> HttpSession::do_build_response() {
    http::response<http::string_body> res;
    const auto& req = parser_->get();

    if (is_options_request()) {
        ResponseBuilder::build_options_response(res, req.version(), req.keep_alive());
    } else {
        res.version(req.version());
        res.keep_alive(req.keep_alive());
        co_await router_->RouteQuery(req, res);
    }
    co_return res;
}

asio::awaitable<beast::error_code> HttpSession::do_write_response(
    http::response<http::string_body>& res) {
    res.prepare_payload();

    beast::error_code ec;
    stream_.socket().set_option(tcp::no_delay(true), ec);

    auto [ec_write, bytes] =
        co_await http::async_write(stream_, res, asio::as_tuple(asio::use_awaitable));
    if (!ec_write) {
        spdlog::trace("[HttpSession] {} <- {} ({} bytes)", peer_, res.result_int(), bytes);
    }
    co_return ec_write;
}

asio::awaitable<void> HttpSession::do_graceful_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected) {
        spdlog::debug("[HttpSession] shutdown of {} failed: {}", peer_, ec.message());
    }

    // Drain until the peer closes or the timeout fires.
    beast::flat_buffer drain;
    stream_.expires_after(std::chrono::seconds(DRAIN_TIMEOUT_SECONDS));
    auto [ec_drain, _] = co_await stream_.async_read_some(drain.prepare(DRAIN_BUFFER_SIZE),
                                                          asio::as_tuple(asio::use_awaitable));
    if (ec_drain && !PeerGone(ec_drain)) {
        spdlog::trace("[HttpSession] drain of {} ended: {}", peer_, ec_drain.message());
    }
    do_close();
}

bool HttpSession::is_options_request() const {
    return parser_->get().method() == http::verb::options;
}

void HttpSession::do_close() {
    beast::error_code ec;
    stream_.socket().close(ec);
}

}  // namespace switchboard::network
