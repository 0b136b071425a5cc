#include <catch2/catch.hpp>

#include "CapabilityAggregator.hpp"
#include "FakeBackend.hpp"
#include "TestRuntime.hpp"

using namespace switchboard;
using namespace switchboard::testing;

namespace {

core::BackendCapabilities Backend(const std::string& id, std::vector<std::string> tools,
                                  std::vector<std::string> uris = {},
                                  std::vector<std::string> prompts = {}) {
    core::BackendCapabilities caps;
    caps.backend_id = id;
    for (auto& t : tools) {
        caps.tools.push_back(MakeTool(std::move(t)));
    }
    for (auto& u : uris) {
        caps.resources.push_back(MakeResource(std::move(u)));
    }
    for (auto& p : prompts) {
        caps.prompts.push_back(MakePrompt(std::move(p)));
    }
    return caps;
}

std::vector<std::string> ToolNames(const core::AggregationResult& r) {
    std::vector<std::string> names;
    for (const auto& t : r.capabilities.tools) {
        names.push_back(t.name);
    }
    return names;
}

}  // namespace

TEST_CASE("prefix strategy qualifies every tool and prompt", "[aggregation]") {
    core::AggregationConfig cfg;
    cfg.prefix_format = "{workload}__";
    core::CapabilityAggregator aggregator(cfg, {MakeTarget("fs"), MakeTarget("git")});

    auto result = aggregator.Merge({Backend("fs", {"read", "write"}, {"file:///a"}, {"help"}),
                                    Backend("git", {"read"}, {"file:///a"}, {"help"})});

    CHECK(ToolNames(result) == std::vector<std::string>{"fs__read", "fs__write", "git__read"});
    CHECK(result.routing.tools.at("git__read").backend_id == "git");
    CHECK(result.routing.tools.at("git__read").original_name == "read");
    CHECK(result.routing.prompts.count("fs__help") == 1);
    CHECK(result.routing.prompts.count("git__help") == 1);

    // Resources are never renamed; the first backend keeps the URI.
    REQUIRE(result.capabilities.resources.size() == 1);
    CHECK(result.routing.resources.at("file:///a").backend_id == "fs");
    CHECK(aggregator.NamePrefix("git") == "git__");
}

TEST_CASE("name prefixes follow the configured format", "[aggregation]") {
    core::AggregationConfig cfg;
    cfg.prefix_format = "mcp-{workload}-";
    CHECK(core::CapabilityAggregator(cfg, {}).NamePrefix("db") == "mcp-db-");

    cfg.strategy = core::AggregationConfig::Strategy::priority;
    CHECK(core::CapabilityAggregator(cfg, {}).NamePrefix("db").empty());
}

TEST_CASE("priority strategy keeps names and drops later duplicates", "[aggregation]") {
    core::AggregationConfig cfg;
    cfg.strategy = core::AggregationConfig::Strategy::priority;
    cfg.priority_order = {"db"};
    core::CapabilityAggregator aggregator(cfg, {MakeTarget("fs"), MakeTarget("db")});

    auto result =
        aggregator.Merge({Backend("fs", {"read", "list"}), Backend("db", {"read", "query"})});

    CHECK(result.routing.tools.size() == 3);
    CHECK(result.routing.tools.at("read").backend_id == "db");
    CHECK(result.routing.tools.at("list").backend_id == "fs");
    CHECK(result.routing.tools.at("query").original_name == "query");
    CHECK(result.capabilities.tools.size() == 3);
}

TEST_CASE("filters and overrides apply before conflict resolution", "[aggregation]") {
    auto fs = MakeTarget("fs");
    fs.tool_filter = {"read", "stat"};
    fs.tool_overrides["stat"] = core::ToolOverride{"info", "File metadata"};

    core::CapabilityAggregator aggregator({}, {fs});
    auto result = aggregator.Merge({Backend("fs", {"read", "write", "stat"})});

    CHECK(ToolNames(result) == std::vector<std::string>{"fs_read", "fs_info"});
    const auto& info = result.routing.tools.at("fs_info");
    CHECK(info.original_name == "stat");
    CHECK(result.capabilities.tools[1].description == "File metadata");
}

TEST_CASE("aggregation reports backends whose listing fails", "[aggregation]") {
    TestRuntime rt(2);
    FakeConnectionFactory connector;

    FakeBackendScript good;
    good.tools.push_back(MakeTool("ping"));
    connector.Add("good", good);
    FakeBackendScript bad;
    bad.tools.push_back(MakeTool("ping"));
    bad.fail_listing = true;
    connector.Add("bad", bad);

    std::vector<core::BackendConnectionPtr> connections{
        connector.Create(rt.executor(), MakeTarget("good"), std::nullopt),
        connector.Create(rt.executor(), MakeTarget("bad"), std::nullopt)};

    core::CapabilityAggregator aggregator({}, {MakeTarget("good"), MakeTarget("bad")});
    auto result = rt.Run(aggregator.Aggregate(connections));

    CHECK(ToolNames(result) == std::vector<std::string>{"good_ping"});
    REQUIRE(result.backend_errors.count("bad") == 1);
    CHECK(result.backend_errors.count("good") == 0);
    for (const auto& [name, entry] : result.routing.tools) {
        CHECK(entry.backend_id == "good");
    }
}

TEST_CASE("descriptors convert to MCP listing JSON", "[aggregation]") {
    auto tool = MakeTool("read");
    auto jv = json::value_from(tool);
    CHECK(jv.as_object().at("name").as_string() == "read");
    CHECK(jv.as_object().at("inputSchema").as_object().at("type").as_string() == "object");
    CHECK(json::value_to<core::Tool>(jv).name == "read");

    json::value prompt_json = {{"name", "explain"}, {"arguments", json::array{}}};
    auto prompt = json::value_to<core::Prompt>(prompt_json);
    CHECK(prompt.name == "explain");
    CHECK(prompt.description.empty());
}
