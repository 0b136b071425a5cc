#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <functional>
#include <string>
#include <vector>

#include "Capabilities.hpp"
#include "Identity.hpp"

namespace switchboard::core {

// Per-operation handlers in the form the protocol front end registers them.
struct ToolRegistration {
    Tool tool;
    std::function<boost::asio::awaitable<boost::json::value>(boost::json::object)> handler;
};

struct ResourceRegistration {
    Resource resource;
    std::function<boost::asio::awaitable<boost::json::value>()> handler;
};

struct PromptRegistration {
    Prompt prompt;
    std::function<boost::asio::awaitable<boost::json::value>(boost::json::object)> handler;
};

struct SessionRegistrations {
    std::vector<ToolRegistration> tools;
    std::vector<ResourceRegistration> resources;
    std::vector<PromptRegistration> prompts;

    // Names the session does not list still reach it, so the caller learns
    // why the call cannot be served.
    std::function<boost::asio::awaitable<boost::json::value>(std::string, boost::json::object)>
        unlisted_tool;
    std::function<boost::asio::awaitable<boost::json::value>(std::string)> unlisted_resource;
    std::function<boost::asio::awaitable<boost::json::value>(std::string, boost::json::object)>
        unlisted_prompt;
};

/**
 * @brief Where the protocol front end keeps the operations each client
 * session exposes.
 */
class ICapabilityRegistrar {
   public:
    virtual ~ICapabilityRegistrar() = default;

    virtual void RegisterSession(const std::string& session_id, SessionRegistrations regs) = 0;
    virtual void UnregisterSession(const std::string& session_id) = 0;
};

/**
 * @brief Session lifecycle hooks the protocol front end drives.
 *
 * Generate() runs with no request context (phase 1); OnRegisterSession() runs
 * later in the same initialize request, once the caller is known (phase 2).
 */
class ISessionHooks {
   public:
    virtual ~ISessionHooks() = default;

    virtual boost::asio::awaitable<std::string> Generate() = 0;
    virtual boost::asio::awaitable<void> OnRegisterSession(std::string id, Identity identity) = 0;
    virtual boost::asio::awaitable<bool> Validate(std::string id) = 0;
    virtual boost::asio::awaitable<void> Terminate(std::string id) = 0;
};

}  // namespace switchboard::core
