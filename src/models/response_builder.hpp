#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/version.hpp>
#include <boost/json.hpp>
#include <string>

namespace switchboard::models {
namespace json = boost::json;
namespace http = boost::beast::http;

// Define this alias for readability
using res_t = http::response<http::string_body>;

class ResponseBuilder {
   private:
    static void set_standard_headers(res_t& res) {
        res.set(http::field::server, "switchboard (" BOOST_BEAST_VERSION_STRING ")");
        res.set(http::field::access_control_allow_origin, "*");
        res.set(http::field::access_control_allow_methods, "GET, POST, DELETE, OPTIONS");
        res.set(http::field::access_control_allow_headers,
                "Content-Type, Authorization, Mcp-Session-Id, MCP-Protocol-Version");
        res.set(http::field::access_control_expose_headers, "Mcp-Session-Id");
        res.set(http::field::access_control_max_age, "3600");
    }

   public:
    static void make_json_response(res_t& res, http::status status, const json::value& val,
                                   unsigned int version, bool keep_alive) {
        res.result(status);
        res.version(version);
        res.keep_alive(keep_alive);

        set_standard_headers(res);
        res.set(http::field::content_type, "application/json");

        res.body() = json::serialize(val);
        res.prepare_payload();
    }

    // Status line and headers only (202 for notifications, 200 for DELETE).
    static void build_empty_response(res_t& res, http::status status, unsigned int version,
                                     bool keep_alive) {
        res.result(status);
        res.version(version);
        res.keep_alive(keep_alive);

        set_standard_headers(res);
        res.body().clear();
        res.prepare_payload();
    }

    // Transport-level failure as a JSON-RPC error without a request id.
    static void build_error_response(res_t& res, const std::string& error_message,
                                     unsigned int version, bool keep_alive = false,
                                     http::status status = http::status::bad_request,
                                     int rpc_code = -32600) {
        json::object error;
        error["code"] = rpc_code;
        error["message"] = error_message;

        json::object body_json;
        body_json["jsonrpc"] = "2.0";
        body_json["id"] = nullptr;
        body_json["error"] = std::move(error);

        make_json_response(res, status, body_json, version, keep_alive);
    }

    static void build_options_response(res_t& res, unsigned int version,
                                       bool keep_alive = true) {
        res.version(version);
        res.keep_alive(keep_alive);
        res.result(http::status::ok);

        set_standard_headers(res);
        res.set(http::field::content_type, "text/plain");
        res.body() = "OK";
        res.prepare_payload();
    }
};

}  // namespace switchboard::models
