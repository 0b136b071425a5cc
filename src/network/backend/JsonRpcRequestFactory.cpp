#include "JsonRpcRequestFactory.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/url/parse.hpp>

#include "Errors.hpp"
#include "Types.hpp"

namespace switchboard::network {

std::string Endpoint::authority() const {
    const bool default_port = (tls && port == "443") || (!tls && port == "80");
    return default_port ? host : host + ":" + port;
}

namespace JsonRpcRequestFactory {

namespace {

void SetCommonHeaders(http::request<http::string_body>& req, const Endpoint& endpoint,
                      const std::string& session_token,
                      const std::optional<core::Credential>& credential) {
    req.set(http::field::host, endpoint.authority());
    req.set(http::field::user_agent, "switchboard");
    req.set(http::field::accept, "application/json, text/event-stream");
    if (!session_token.empty()) {
        req.set(kSessionHeader, session_token);
        req.set("MCP-Protocol-Version", kProtocolVersion);
    }
    if (credential) {
        req.set(credential->header, credential->value);
    }
}

}  // namespace

Endpoint ParseEndpoint(const std::string& url) {
    auto parsed = boost::urls::parse_uri(url);
    if (!parsed) {
        throw boost::system::system_error(parsed.error(), "invalid backend url '" + url + "'");
    }
    const auto& u = *parsed;

    Endpoint ep;
    ep.scheme = std::string(u.scheme());
    if (ep.scheme != "http" && ep.scheme != "https") {
        Throw(errc::invalid_request, "unsupported scheme in backend url '" + url + "'");
    }
    ep.tls = ep.scheme == "https";
    ep.host = u.host_address();
    if (ep.host.empty()) {
        Throw(errc::invalid_request, "backend url '" + url + "' has no host");
    }
    ep.port = u.has_port() ? std::string(u.port()) : (ep.tls ? "443" : "80");

    std::string target(u.encoded_path());
    if (target.empty()) {
        target = "/";
    }
    if (u.has_query()) {
        target += "?";
        target += std::string(u.encoded_query());
    }
    ep.target = std::move(target);
    return ep;
}

json::object MakeRequest(std::int64_t id, const std::string& method, json::object params) {
    json::object msg;
    msg["jsonrpc"] = "2.0";
    msg["id"] = id;
    msg["method"] = method;
    msg["params"] = std::move(params);
    return msg;
}

json::object MakeNotification(const std::string& method, json::object params) {
    json::object msg;
    msg["jsonrpc"] = "2.0";
    msg["method"] = method;
    if (!params.empty()) {
        msg["params"] = std::move(params);
    }
    return msg;
}

http::request<http::string_body> MakePost(const Endpoint& endpoint, const json::object& message,
                                          const std::string& session_token,
                                          const std::optional<core::Credential>& credential) {
    http::request<http::string_body> req{http::verb::post, endpoint.target, 11};
    SetCommonHeaders(req, endpoint, session_token, credential);
    req.set(http::field::content_type, "application/json");
    req.body() = json::serialize(message);
    req.prepare_payload();
    return req;
}

http::request<http::string_body> MakeDelete(const Endpoint& endpoint,
                                            const std::string& session_token,
                                            const std::optional<core::Credential>& credential) {
    http::request<http::string_body> req{http::verb::delete_, endpoint.target, 11};
    SetCommonHeaders(req, endpoint, session_token, credential);
    req.prepare_payload();
    return req;
}

}  // namespace JsonRpcRequestFactory

}  // namespace switchboard::network
