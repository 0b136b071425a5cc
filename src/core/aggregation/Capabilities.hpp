#pragma once

#include <boost/json.hpp>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace switchboard::core {

// Descriptors as exposed by a backend (original names) or to the client
// (exposed names). Wire format follows the MCP listing results.
struct Tool {
    std::string name;
    std::string description;
    boost::json::object input_schema;
};

struct Resource {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;
};

struct Prompt {
    std::string name;
    std::string description;
    boost::json::array arguments;
};

/**
 * @brief One routing decision. The exposed name may have been rewritten to
 * resolve a collision; backends always receive original_name.
 */
struct RoutingEntry {
    std::string exposed_name;
    std::string backend_id;
    std::string original_name;
};

struct RoutingTable {
    std::unordered_map<std::string, RoutingEntry> tools;
    std::unordered_map<std::string, RoutingEntry> resources;  // keyed by URI
    std::unordered_map<std::string, RoutingEntry> prompts;

    bool empty() const noexcept { return tools.empty() && resources.empty() && prompts.empty(); }
};

struct CapabilitySet {
    std::vector<Tool> tools;
    std::vector<Resource> resources;
    std::vector<Prompt> prompts;

    bool empty() const noexcept { return tools.empty() && resources.empty() && prompts.empty(); }
};

struct AggregationResult {
    CapabilitySet capabilities;
    RoutingTable routing;
    std::map<std::string, std::string> backend_errors;  // backend id -> reason
};

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const Tool& t);
Tool tag_invoke(boost::json::value_to_tag<Tool>, const boost::json::value& jv);

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const Resource& r);
Resource tag_invoke(boost::json::value_to_tag<Resource>, const boost::json::value& jv);

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const Prompt& p);
Prompt tag_invoke(boost::json::value_to_tag<Prompt>, const boost::json::value& jv);

}  // namespace switchboard::core
