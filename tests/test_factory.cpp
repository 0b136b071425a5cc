#include <catch2/catch.hpp>

#include "Errors.hpp"
#include "SessionFixture.hpp"

using namespace switchboard;
using namespace switchboard::testing;
using namespace std::chrono_literals;

namespace {

FakeBackendScript OneTool(const std::string& name, bool fail = false) {
    FakeBackendScript script;
    script.tools.push_back(MakeTool(name));
    script.fail_initialize = fail;
    return script;
}

}  // namespace

TEST_CASE("backends that fail to initialize are left out of the session", "[factory]") {
    SessionFixture fx;
    std::vector<std::shared_ptr<FakeBackend>> backends;
    for (int i = 0; i < 5; ++i) {
        const bool fail = i == 1 || i == 3;
        backends.push_back(fx.AddBackend("b" + std::to_string(i), OneTool("tool", fail)));
    }

    auto session = fx.MakeSession();
    REQUIRE(session);

    CHECK(session->ConnectedBackends() == std::vector<std::string>{"b0", "b2", "b4"});
    CHECK(session->FailedBackends().size() == 2);
    CHECK(session->BackendSessionIds().size() == 3);

    std::vector<std::string> tools;
    for (const auto& t : session->Tools()) {
        tools.push_back(t.name);
    }
    std::sort(tools.begin(), tools.end());
    CHECK(tools == std::vector<std::string>{"b0_tool", "b2_tool", "b4_tool"});
    CHECK(session->Routing().tools.size() == 3);

    // Half-open handshakes are released.
    CHECK(backends[1]->closes.load() == 1);
    CHECK(backends[3]->closes.load() == 1);
    CHECK(backends[0]->closes.load() == 0);

    CHECK(fx.observer->backends_up.load() == 3);
    CHECK(fx.observer->backends_down.load() == 2);
    CHECK(fx.observer->created.load() == 1);

    fx.Close(session);
}

TEST_CASE("a session is created even when every backend fails", "[factory]") {
    SessionFixture fx;
    for (int i = 0; i < 5; ++i) {
        fx.AddBackend("b" + std::to_string(i), OneTool("tool", true));
    }

    auto session = fx.MakeSession();
    REQUIRE(session);
    CHECK(session->ConnectedBackends().empty());
    CHECK(session->Routing().empty());
    CHECK(session->Capabilities().empty());

    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "read_file"); }),
             errc::no_backends_available));
    CHECK(Is(ErrorOf([&] { fx.runtime.Run(session->ReadResource("file:///a")); }),
             errc::no_backends_available));
    // Names qualified with a failed backend say which backend is missing.
    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "b2_tool"); }), errc::backend_unavailable));

    fx.Close(session);
    CHECK(session->IsClosed());
}

TEST_CASE("a session with no backends configured is empty", "[factory]") {
    SessionFixture fx;
    auto session = fx.MakeSession();
    CHECK(session->ConnectedBackends().empty());
    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "anything"); }),
             errc::no_backends_available));
    fx.Close(session);
}

TEST_CASE("an unresponsive backend does not hold up the others", "[factory][deadline]") {
    SessionFixture fx;
    fx.config.backend_timeout = 100ms;
    auto stuck_script = OneTool("tool");
    stuck_script.init_delay = 3000ms;
    fx.AddBackend("stuck", stuck_script);
    fx.AddBackend("quick", OneTool("tool"));

    const auto started = std::chrono::steady_clock::now();
    auto session = fx.MakeSession();
    CHECK(std::chrono::steady_clock::now() - started < 1500ms);

    CHECK(session->ConnectedBackends() == std::vector<std::string>{"quick"});
    REQUIRE(session->FailedBackends().count("stuck") == 1);
    CHECK(session->FailedBackends().at("stuck").find("deadline") != std::string::npos);

    fx.Close(session);
}

TEST_CASE("the creation deadline bounds every backend", "[factory][deadline]") {
    SessionFixture fx;
    fx.config.max_concurrency = 1;
    fx.config.creation_timeout = 150ms;
    for (const auto* id : {"first", "second", "third"}) {
        auto script = OneTool("tool");
        script.init_delay = 100ms;
        fx.AddBackend(id, script);
    }

    const auto started = std::chrono::steady_clock::now();
    auto session = fx.MakeSession();
    CHECK(std::chrono::steady_clock::now() - started < 1000ms);

    CHECK(session->ConnectedBackends() == std::vector<std::string>{"first"});
    CHECK(session->FailedBackends().size() == 2);
    fx.Close(session);
}

TEST_CASE("backend initialization is bounded by max_concurrency", "[factory]") {
    SessionFixture fx;
    fx.config.max_concurrency = 2;
    for (int i = 0; i < 6; ++i) {
        auto script = OneTool("tool");
        script.init_delay = 40ms;
        fx.AddBackend("b" + std::to_string(i), script);
    }

    auto session = fx.MakeSession();
    CHECK(session->ConnectedBackends().size() == 6);
    CHECK(fx.connector->initializations().peak() <= 2);
    CHECK(fx.connector->initializations().peak() >= 1);
    fx.Close(session);
}

TEST_CASE("a backend requested twice gets one connection", "[factory]") {
    SessionFixture fx;
    auto a = fx.AddBackend("a", OneTool("tool"));
    fx.targets.push_back(fx.targets.front());

    auto session = fx.MakeSession();
    CHECK(session->ConnectedBackends() == std::vector<std::string>{"a"});
    CHECK(a->initializations.load() == 1);
    fx.Close(session);
}

TEST_CASE("a backend whose listing fails stays connected without operations", "[factory]") {
    SessionFixture fx;
    fx.AddBackend("good", OneTool("tool"));
    auto mute_script = OneTool("tool");
    mute_script.fail_listing = true;
    fx.AddBackend("mute", mute_script);

    auto session = fx.MakeSession();
    CHECK(session->ConnectedBackends() == std::vector<std::string>{"good", "mute"});
    REQUIRE(session->Tools().size() == 1);
    CHECK(session->Tools().front().name == "good_tool");
    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "mute_tool"); }),
             errc::operation_not_found));
    fx.Close(session);
}
