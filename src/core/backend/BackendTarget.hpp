#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace switchboard::core {

// How the outgoing credential for a backend is obtained.
struct BackendAuth {
    enum class Type { unauthenticated, header_injection, pass_through };

    Type type = Type::unauthenticated;
    std::string header_name = "Authorization";
    std::string header_value;  // header_injection only; may reference ${ENV}
};

struct ToolOverride {
    std::string name;         // empty keeps the original name
    std::string description;  // empty keeps the original description
};

/**
 * @brief Static description of one backend, as configured.
 */
struct BackendTarget {
    std::string id;
    std::string url;
    std::chrono::milliseconds request_timeout{30000};
    bool keepalive = true;
    BackendAuth auth;

    std::vector<std::string> tool_filter;  // empty exposes every tool
    std::map<std::string, ToolOverride> tool_overrides;
};

}  // namespace switchboard::core
