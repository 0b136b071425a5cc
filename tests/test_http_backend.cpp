#include <catch2/catch.hpp>

#include "Errors.hpp"
#include "HttpBackendConnection.hpp"
#include "JsonRpcRequestFactory.hpp"
#include "Types.hpp"

using namespace switchboard;
namespace rpc = switchboard::network::JsonRpcRequestFactory;

TEST_CASE("event stream replies are matched by request id", "[backend][sse]") {
    SECTION("the reply follows a server notification") {
        const std::string body =
            "event: message\n"
            "data: {\"jsonrpc\":\"2.0\",\"method\":\"notifications/progress\"}\n"
            "\n"
            "event: message\n"
            "data: {\"jsonrpc\":\"2.0\",\"id\":7,\"result\":{\"ok\":true}}\n"
            "\n";
        auto reply = network::FindEventStreamReply(body, 7);
        REQUIRE(reply);
        CHECK(reply->at("result").as_object().at("ok").as_bool());
    }

    SECTION("CRLF framing and no trailing blank line") {
        const std::string body = "data: {\"jsonrpc\":\"2.0\",\"id\":3,\"error\":{\"code\":-1}}\r\n";
        auto reply = network::FindEventStreamReply(body, 3);
        REQUIRE(reply);
        CHECK(reply->contains("error"));
    }

    SECTION("data split across lines") {
        const std::string body =
            "data: {\"jsonrpc\":\"2.0\",\n"
            "data: \"id\":4,\"result\":{}}\n"
            "\n";
        CHECK(network::FindEventStreamReply(body, 4));
    }

    SECTION("a reply for another request is ignored") {
        const std::string body = "data: {\"jsonrpc\":\"2.0\",\"id\":5,\"result\":{}}\n\n";
        CHECK_FALSE(network::FindEventStreamReply(body, 6));
        CHECK_FALSE(network::FindEventStreamReply("data: not json\n\n", 1));
    }
}

TEST_CASE("backend URLs are parsed into endpoints", "[backend][url]") {
    SECTION("http with default port") {
        auto ep = rpc::ParseEndpoint("http://tools.local/mcp");
        CHECK_FALSE(ep.tls);
        CHECK(ep.host == "tools.local");
        CHECK(ep.port == "80");
        CHECK(ep.target == "/mcp");
        CHECK(ep.authority() == "tools.local");
    }

    SECTION("https with explicit port and query") {
        auto ep = rpc::ParseEndpoint("https://db.internal:8443/v1/mcp?tenant=a");
        CHECK(ep.tls);
        CHECK(ep.port == "8443");
        CHECK(ep.target == "/v1/mcp?tenant=a");
        CHECK(ep.authority() == "db.internal:8443");
    }

    SECTION("empty path becomes root") {
        CHECK(rpc::ParseEndpoint("https://db.internal").target == "/");
    }

    SECTION("unsupported or malformed URLs are rejected") {
        CHECK_THROWS_AS(rpc::ParseEndpoint("ftp://files.local/mcp"), boost::system::system_error);
        CHECK_THROWS_AS(rpc::ParseEndpoint("not a url"), boost::system::system_error);
    }
}

TEST_CASE("requests to backends carry session and credential headers", "[backend][http]") {
    const auto ep = rpc::ParseEndpoint("http://fs.local:7001/mcp");
    auto message = rpc::MakeRequest(1, "tools/list", {});

    SECTION("before initialization") {
        auto req = rpc::MakePost(ep, message, "", std::nullopt);
        CHECK(req.method() == http::verb::post);
        CHECK(req.target() == "/mcp");
        CHECK(req[http::field::host] == "fs.local:7001");
        CHECK(req[http::field::content_type] == "application/json");
        CHECK(req.find(rpc::kSessionHeader) == req.end());
        CHECK(req.find(http::field::authorization) == req.end());

        auto body = json::parse(req.body()).as_object();
        CHECK(body.at("method").as_string() == "tools/list");
        CHECK(body.at("id").as_int64() == 1);
    }

    SECTION("with an established session and injected credential") {
        core::Credential cred{"X-Api-Key", "secret"};
        auto req = rpc::MakePost(ep, message, "backend-session-1", cred);
        CHECK(req[rpc::kSessionHeader] == "backend-session-1");
        CHECK(req["MCP-Protocol-Version"] == rpc::kProtocolVersion);
        CHECK(req["X-Api-Key"] == "secret");
    }

    SECTION("delete ends the backend session") {
        auto req = rpc::MakeDelete(ep, "backend-session-1", std::nullopt);
        CHECK(req.method() == http::verb::delete_);
        CHECK(req[rpc::kSessionHeader] == "backend-session-1");
        CHECK(req.body().empty());
    }

    SECTION("notifications have no id") {
        auto note = rpc::MakeNotification("notifications/initialized");
        CHECK_FALSE(note.contains("id"));
        CHECK_FALSE(note.contains("params"));
    }
}
