#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/post.hpp>
#include <catch2/catch.hpp>
#include <future>
#include <set>
#include <thread>

#include "Errors.hpp"
#include "SessionFixture.hpp"

using namespace switchboard;
using namespace switchboard::testing;
using namespace std::chrono_literals;

namespace {

FakeBackendScript WithTools(std::initializer_list<const char*> names) {
    FakeBackendScript script;
    for (const auto* n : names) {
        script.tools.push_back(MakeTool(n));
    }
    return script;
}

}  // namespace

TEST_CASE("sessions never share backend connections", "[session][isolation]") {
    SessionFixture fx;
    fx.AddBackend("a", WithTools({"echo"}));
    fx.AddBackend("b", WithTools({"echo"}));
    auto factory = fx.MakeFactory();

    auto first = fx.runtime.Spawn(factory->MakeSession("s-a", {}, fx.targets));
    auto second = fx.runtime.Spawn(factory->MakeSession("s-b", {}, fx.targets));
    auto session_a = TestRuntime::Await(std::move(first));
    auto session_b = TestRuntime::Await(std::move(second));

    REQUIRE(fx.connector->created().size() == 4);

    auto tokens_a = session_a->BackendSessionIds();
    auto tokens_b = session_b->BackendSessionIds();
    REQUIRE(tokens_a.size() == 2);
    REQUIRE(tokens_b.size() == 2);
    for (const auto& [backend, token] : tokens_a) {
        CHECK(tokens_b.at(backend) != token);
    }

    SECTION("each session talks to its own connection") {
        auto via_a = Call(fx.runtime, session_a, "a_echo");
        auto via_b = Call(fx.runtime, session_b, "a_echo");
        CHECK(Field(via_a, "token") == tokens_a.at("a"));
        CHECK(Field(via_b, "token") == tokens_b.at("a"));
    }

    SECTION("closing one session leaves the other usable") {
        fx.Close(session_a);
        CHECK(session_a->IsClosed());
        CHECK(Field(Call(fx.runtime, session_b, "b_echo"), "token") == tokens_b.at("b"));
    }

    fx.Close(session_a);
    fx.Close(session_b);
}

TEST_CASE("every routing entry reaches its backend under the original name",
          "[session][routing]") {
    SessionFixture fx;
    auto fs_script = WithTools({"read", "write"});
    fs_script.resources.push_back(MakeResource("file:///etc/motd"));
    fs_script.prompts.push_back(MakePrompt("summarize"));
    auto fs = fx.AddBackend("fs", fs_script);

    auto db_script = WithTools({"read", "query"});
    db_script.prompts.push_back(MakePrompt("summarize"));
    auto db = fx.AddBackend("db", db_script);

    // Renamed tools must still be called by their original name.
    fx.targets[1].tool_overrides["query"] = core::ToolOverride{"sql", ""};
    auto session = fx.MakeSession();

    const auto routing = session->Routing();
    REQUIRE(routing.tools.size() == 4);
    REQUIRE(routing.tools.count("db_sql") == 1);
    REQUIRE(routing.prompts.size() == 2);
    REQUIRE(routing.resources.size() == 1);

    for (const auto& [exposed, entry] : routing.tools) {
        auto result = Call(fx.runtime, session, exposed);
        CHECK(Field(result, "backend") == entry.backend_id);
        CHECK(Field(result, "name") == entry.original_name);
    }
    for (const auto& [exposed, entry] : routing.prompts) {
        auto result = fx.runtime.Run(session->GetPrompt(exposed, json::object{}));
        CHECK(Field(result, "backend") == entry.backend_id);
        CHECK(Field(result, "name") == entry.original_name);
    }
    for (const auto& [uri, entry] : routing.resources) {
        auto result = fx.runtime.Run(session->ReadResource(uri));
        CHECK(Field(result, "backend") == "fs");
        CHECK(Field(result, "name") == uri);
    }

    CHECK(routing.tools.at("db_sql").original_name == "query");
    const auto db_calls = db->received();
    CHECK(std::count(db_calls.begin(), db_calls.end(), "query") == 1);
    CHECK(std::count(db_calls.begin(), db_calls.end(), "sql") == 0);
    CHECK(fs->received().size() == 4);

    {
        std::lock_guard<std::mutex> lock(fx.observer->mutex_);
        const auto& ops = fx.observer->operations;
        CHECK(std::count(ops.begin(), ops.end(), "tool:db_sql") == 1);
        CHECK(std::count(ops.begin(), ops.end(), "resource:file:///etc/motd") == 1);
        CHECK(std::count(ops.begin(), ops.end(), "prompt:fs_summarize") == 1);
    }

    fx.Close(session);
}

TEST_CASE("unknown names are reported without touching backends", "[session][routing]") {
    SessionFixture fx;
    auto a = fx.AddBackend("a", WithTools({"echo"}));
    auto session = fx.MakeSession();

    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "a_missing"); }), errc::operation_not_found));
    CHECK(Is(ErrorOf([&] { fx.runtime.Run(session->ReadResource("file:///nowhere")); }),
             errc::operation_not_found));
    CHECK(Is(ErrorOf([&] { fx.runtime.Run(session->GetPrompt("a_none", json::object{})); }),
             errc::operation_not_found));
    CHECK(a->calls.load() == 0);

    // Still usable afterwards.
    CHECK(Field(Call(fx.runtime, session, "a_echo"), "backend") == "a");
    fx.Close(session);
}

TEST_CASE("a failed backend is reported as unavailable, not as a missing operation",
          "[session][scenario]") {
    SessionFixture fx;
    fx.aggregation.prefix_format = "{workload}.";
    fx.AddBackend("fs", WithTools({"readFile"}));
    auto db_script = WithTools({"query"});
    db_script.fail_initialize = true;
    fx.AddBackend("db", db_script);

    auto session = fx.MakeSession();
    REQUIRE(session->ConnectedBackends() == std::vector<std::string>{"fs"});
    REQUIRE(session->FailedBackends().count("db") == 1);

    CHECK(Field(Call(fx.runtime, session, "fs.readFile"), "name") == "readFile");

    const auto start = std::chrono::steady_clock::now();
    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "db.query"); }), errc::backend_unavailable));
    CHECK(std::chrono::steady_clock::now() - start < 1s);

    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "other.query"); }),
             errc::operation_not_found));
    fx.Close(session);
}

TEST_CASE("failed backends are recognized under any prefix format", "[session][routing]") {
    const auto format = GENERATE(std::string("{workload}~"), std::string("mcp-{workload}-"));
    SessionFixture fx;
    fx.aggregation.prefix_format = format;
    fx.AddBackend("fs", WithTools({"read"}));
    auto db_script = WithTools({"query"});
    db_script.fail_initialize = true;
    fx.AddBackend("db", db_script);
    auto session = fx.MakeSession();

    const auto qualify = [&](const std::string& backend, const std::string& name) {
        return format == "{workload}~" ? backend + "~" + name : "mcp-" + backend + "-" + name;
    };
    CHECK(Field(Call(fx.runtime, session, qualify("fs", "read")), "name") == "read");
    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, qualify("db", "query")); }),
             errc::backend_unavailable));
    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "db_query"); }), errc::operation_not_found));
    fx.Close(session);
}

TEST_CASE("the session lock is not held while a backend call is in progress", "[session][locking]") {
    SessionFixture fx;
    auto slow_script = WithTools({"wait"});
    slow_script.call_delay = 400ms;
    auto slow = fx.AddBackend("slow", slow_script);
    auto flaky = fx.AddBackend("flaky", WithTools({"poke"}));
    auto session = fx.MakeSession();

    auto pending = fx.runtime.Spawn(session->CallTool("slow_wait", json::object{}));
    REQUIRE(WaitUntil([&] { return slow->in_flight.current() == 1; }));

    // Readers go through while the call is suspended in the backend.
    CHECK(session->Routing().tools.size() == 2);
    CHECK(session->Tools().size() == 2);

    // Re-initialization needs the write lock; it must complete during the delay.
    const auto token_before = session->BackendSessionIds().at("flaky");
    flaky->ExpireNextCalls(1);
    CHECK(Field(Call(fx.runtime, session, "flaky_poke"), "backend") == "flaky");
    CHECK(slow->in_flight.current() == 1);
    CHECK(session->BackendSessionIds().at("flaky") != token_before);
    CHECK(fx.observer->reinitialized.load() == 1);

    CHECK(Field(TestRuntime::Await(std::move(pending)), "backend") == "slow");
    fx.Close(session);
}

TEST_CASE("close waits for in-flight calls before closing connections", "[session][shutdown]") {
    SessionFixture fx;
    auto script = WithTools({"work"});
    script.call_delay = 250ms;
    auto backend = fx.AddBackend("a", script);
    auto idle = fx.AddBackend("b", WithTools({"noop"}));
    auto session = fx.MakeSession();

    std::vector<std::future<json::value>> calls;
    for (int i = 0; i < 3; ++i) {
        calls.push_back(fx.runtime.Spawn(session->CallTool("a_work", json::object{})));
    }
    REQUIRE(WaitUntil([&] { return backend->in_flight.current() == 3; }));
    CHECK(session->InFlight() == 3);

    auto closing = fx.runtime.Spawn(session->Close());
    REQUIRE(WaitUntil([&] { return session->IsClosed(); }));

    // New calls are refused as soon as close begins.
    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "b_noop"); }), errc::session_closed));

    std::this_thread::sleep_for(50ms);
    CHECK(backend->closes.load() == 0);
    CHECK(idle->closes.load() == 0);
    CHECK(closing.wait_for(0ms) != std::future_status::ready);

    for (auto& call : calls) {
        CHECK(Field(TestRuntime::Await(std::move(call)), "backend") == "a");
    }
    TestRuntime::Await(std::move(closing));

    CHECK(session->InFlight() == 0);
    CHECK(backend->closes.load() == 1);
    CHECK(idle->closes.load() == 1);
    CHECK(backend->in_flight_at_close() == std::vector<int>{0});
    CHECK(fx.observer->closed.load() == 1);

    SECTION("closing twice is a no-op") {
        fx.Close(session);
        CHECK(backend->closes.load() == 1);
    }
}

TEST_CASE("close reports connections that failed to close", "[session][shutdown]") {
    SessionFixture fx;
    auto broken = WithTools({"x"});
    broken.fail_close = true;
    fx.AddBackend("broken", broken);
    auto fine = fx.AddBackend("fine", WithTools({"y"}));
    auto session = fx.MakeSession();

    try {
        fx.Close(session);
        FAIL("close should report the failed connection");
    } catch (const SessionCloseError& e) {
        REQUIRE(e.failures().size() == 1);
        CHECK(e.failures().front().rfind("broken", 0) == 0);
    }
    CHECK(fine->closes.load() == 1);
    CHECK(session->IsClosed());
}

TEST_CASE("an expired backend session is re-initialized once and the call retried",
          "[session][recovery]") {
    SessionFixture fx;
    auto backend = fx.AddBackend("a", WithTools({"echo"}));
    auto session = fx.MakeSession();
    const auto old_token = session->BackendSessionIds().at("a");

    backend->ExpireNextCalls(1);
    auto result = Call(fx.runtime, session, "a_echo");

    CHECK(Field(result, "token") != old_token);
    CHECK(session->BackendSessionIds().at("a") == Field(result, "token"));
    CHECK(backend->initializations.load() == 2);
    CHECK(backend->calls.load() == 2);
    CHECK(backend->closed_tokens() == std::vector<std::string>{old_token});
    CHECK(fx.observer->reinitialized.load() == 1);

    fx.Close(session);
}

TEST_CASE("a backend that always reports expiry gets one re-initialization per call",
          "[session][recovery]") {
    SessionFixture fx;
    auto script = WithTools({"echo"});
    script.always_expired = true;
    auto backend = fx.AddBackend("a", script);
    auto session = fx.MakeSession();
    REQUIRE(backend->initializations.load() == 1);

    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "a_echo"); }), errc::backend_session_expired));
    CHECK(backend->initializations.load() == 2);
    CHECK(backend->calls.load() == 2);

    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "a_echo"); }), errc::backend_session_expired));
    CHECK(backend->initializations.load() == 3);
    CHECK(backend->calls.load() == 4);

    fx.Close(session);
}

TEST_CASE("recovery can be disabled", "[session][recovery]") {
    SessionFixture fx;
    fx.config.recovery.max_retries = 0;
    auto backend = fx.AddBackend("a", WithTools({"echo"}));
    auto session = fx.MakeSession();

    backend->ExpireNextCalls(1);
    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "a_echo"); }), errc::backend_session_expired));
    CHECK(backend->initializations.load() == 1);
    CHECK(fx.observer->reinitialized.load() == 0);
    fx.Close(session);
}

TEST_CASE("a rejected credential is re-resolved on a fresh connection", "[session][recovery]") {
    SessionFixture fx;
    fx.config.recovery.backoff_initial = 20ms;
    auto backend = fx.AddBackend("a", WithTools({"echo"}));
    fx.targets[0].auth.type = core::BackendAuth::Type::pass_through;

    core::Identity caller;
    caller.subject = "alice";
    caller.token = "t0k3n";
    auto session = fx.MakeSession("s-1", caller);
    REQUIRE(fx.connector->created().size() == 1);

    backend->RejectNextCalls(1);
    CHECK(Field(Call(fx.runtime, session, "a_echo"), "backend") == "a");

    const auto created = fx.connector->created();
    REQUIRE(created.size() == 2);
    REQUIRE(created[1]->credential().has_value());
    CHECK(created[1]->credential()->header == "Authorization");
    CHECK(created[1]->credential()->value == "Bearer t0k3n");
    CHECK(created[0]->closed());
    fx.Close(session);
}

TEST_CASE("a failed re-initialization keeps the previous connection", "[session][recovery]") {
    SessionFixture fx;
    auto backend = fx.AddBackend("a", WithTools({"echo"}));
    auto session = fx.MakeSession();
    const auto token = session->BackendSessionIds().at("a");

    backend->ExpireNextCalls(1);
    backend->FailNextInitializations(1);
    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "a_echo"); }), errc::backend_unavailable));
    CHECK(session->BackendSessionIds().at("a") == token);
    CHECK(backend->closes.load() == 1);  // only the half-initialized replacement

    CHECK(Field(Call(fx.runtime, session, "a_echo"), "token") == token);
    fx.Close(session);
}

TEST_CASE("the circuit opens after repeated recovery failures", "[session][recovery]") {
    SessionFixture fx;
    fx.config.recovery.breaker.failure_threshold = 2;
    fx.config.recovery.breaker.open_duration = 30000ms;
    auto backend = fx.AddBackend("a", WithTools({"echo"}));
    auto other = fx.AddBackend("b", WithTools({"echo"}));
    auto session = fx.MakeSession();

    backend->ExpireNextCalls(100);
    backend->FailNextInitializations(100);
    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "a_echo"); }), errc::backend_unavailable));
    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "a_echo"); }), errc::backend_unavailable));

    const auto calls_before = backend->calls.load();
    const auto inits_before = backend->initializations.load();
    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "a_echo"); }), errc::circuit_open));
    CHECK(backend->calls.load() == calls_before);
    CHECK(backend->initializations.load() == inits_before);

    // Other backends are unaffected.
    CHECK(Field(Call(fx.runtime, session, "b_echo"), "backend") == "b");
    CHECK(other->initializations.load() == 1);
    fx.Close(session);
}

TEST_CASE("concurrent failures on one backend share a single re-initialization",
          "[session][recovery]") {
    SessionFixture fx;
    auto script = WithTools({"echo"});
    script.call_delay = 100ms;
    script.init_delay = 100ms;
    auto backend = fx.AddBackend("a", script);
    auto session = fx.MakeSession();
    REQUIRE(backend->initializations.load() == 1);

    backend->ExpireNextCalls(4);
    std::vector<std::future<json::value>> calls;
    for (int i = 0; i < 4; ++i) {
        calls.push_back(fx.runtime.Spawn(session->CallTool("a_echo", json::object{})));
    }

    std::set<std::string> tokens;
    for (auto& call : calls) {
        tokens.insert(Field(TestRuntime::Await(std::move(call)), "token"));
    }
    CHECK(tokens.size() == 1);
    CHECK(backend->initializations.load() == 2);
    CHECK(fx.observer->reinitialized.load() == 1);
    fx.Close(session);
}

TEST_CASE("a cancelled call returns without recovering", "[session][cancellation]") {
    SessionFixture fx;
    auto script = WithTools({"wait"});
    script.call_delay = 2000ms;
    auto backend = fx.AddBackend("a", script);
    auto session = fx.MakeSession();

    asio::cancellation_signal signal;
    auto call = asio::co_spawn(fx.runtime.executor(),
                               session->CallTool("a_wait", json::object{}),
                               asio::bind_cancellation_slot(signal.slot(), asio::use_future));
    REQUIRE(WaitUntil([&] { return backend->in_flight.current() == 1; }));

    std::promise<void> emitted;
    asio::post(fx.runtime.executor(), [&] {
        signal.emit(asio::cancellation_type::terminal);
        emitted.set_value();
    });
    emitted.get_future().wait();

    const auto ec = ErrorOf([&] { TestRuntime::Await(std::move(call)); });
    CHECK(ec == asio::error::operation_aborted);
    CHECK(session->InFlight() == 0);
    CHECK(backend->initializations.load() == 1);
    CHECK(fx.observer->reinitialized.load() == 0);
    fx.Close(session);
}

TEST_CASE("cancelling a half-open recovery during backoff leaves recovery possible",
          "[session][recovery][cancellation]") {
    SessionFixture fx;
    fx.config.recovery.breaker.failure_threshold = 1;
    fx.config.recovery.breaker.open_duration = 50ms;
    fx.config.recovery.backoff_initial = 1000ms;
    fx.config.recovery.backoff_max = 1000ms;
    auto backend = fx.AddBackend("a", WithTools({"echo"}));
    auto session = fx.MakeSession();
    const auto token = session->BackendSessionIds().at("a");

    // One failed re-initialization opens the circuit.
    backend->ExpireNextCalls(1);
    backend->FailNextInitializations(1);
    CHECK(Is(ErrorOf([&] { Call(fx.runtime, session, "a_echo"); }), errc::backend_unavailable));
    std::this_thread::sleep_for(100ms);

    // A rejected credential becomes the half-open trial and waits out its backoff.
    const auto calls_before = backend->calls.load();
    backend->RejectNextCalls(1);
    asio::cancellation_signal signal;
    auto cancelled = asio::co_spawn(fx.runtime.executor(),
                                    session->CallTool("a_echo", json::object{}),
                                    asio::bind_cancellation_slot(signal.slot(), asio::use_future));
    REQUIRE(WaitUntil([&] { return backend->calls.load() == calls_before + 1; }));

    // An expired call joins the same re-initialization.
    backend->ExpireNextCalls(1);
    auto follower = fx.runtime.Spawn(session->CallTool("a_echo", json::object{}));
    REQUIRE(WaitUntil([&] {
        return backend->calls.load() == calls_before + 2 && backend->in_flight.current() == 0;
    }));
    std::this_thread::sleep_for(50ms);

    std::promise<void> emitted;
    asio::post(fx.runtime.executor(), [&] {
        signal.emit(asio::cancellation_type::terminal);
        emitted.set_value();
    });
    emitted.get_future().wait();

    CHECK(ErrorOf([&] { TestRuntime::Await(std::move(cancelled)); }) ==
          asio::error::operation_aborted);

    // The follower was not cancelled: it recovers on its own and succeeds.
    const auto recovered = TestRuntime::Await(std::move(follower));
    CHECK(Field(recovered, "token") != token);
    CHECK(fx.observer->reinitialized.load() == 1);

    // The breaker closed again, so later failures still recover.
    backend->ExpireNextCalls(1);
    CHECK(Field(Call(fx.runtime, session, "a_echo"), "backend") == "a");
    CHECK(fx.observer->reinitialized.load() == 2);
    fx.Close(session);
}

TEST_CASE("keepalive pings backends and recovers expired ones", "[session][keepalive]") {
    SessionFixture fx;
    fx.config.keepalive_interval = 30ms;

    auto pinged_script = WithTools({"echo"});
    pinged_script.supports_keepalive = true;
    auto pinged = fx.AddBackend("pinged", pinged_script);
    auto silent = fx.AddBackend("silent", WithTools({"echo"}));
    auto opted_out = fx.AddBackend("opted", pinged_script);
    fx.targets[2].keepalive = false;

    auto session = fx.MakeSession();
    const auto token = session->BackendSessionIds().at("pinged");

    REQUIRE(WaitUntil([&] { return pinged->pings.load() >= 2; }));
    CHECK(silent->pings.load() == 0);
    CHECK(opted_out->pings.load() == 0);

    SECTION("an expired ping triggers re-initialization") {
        pinged->ExpireNextPings(1);
        REQUIRE(WaitUntil([&] { return fx.observer->reinitialized.load() == 1; }));
        CHECK(session->BackendSessionIds().at("pinged") != token);
        CHECK(Field(Call(fx.runtime, session, "pinged_echo"), "backend") == "pinged");
    }

    SECTION("pings stop once the session is closed") {
        fx.Close(session);
        std::this_thread::sleep_for(60ms);
        const auto after_close = pinged->pings.load();
        std::this_thread::sleep_for(100ms);
        CHECK(pinged->pings.load() == after_close);
    }

    fx.Close(session);
}
