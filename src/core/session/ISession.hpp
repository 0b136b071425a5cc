#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "Capabilities.hpp"

namespace switchboard::core {

/**
 * @brief Client-facing surface of a session.
 *
 * Session implements it; decorators wrap it to add behavior for selected
 * operations without touching routing or lifecycle code.
 */
class ISession {
   public:
    virtual ~ISession() = default;

    virtual const std::string& Id() const = 0;

    virtual boost::asio::awaitable<boost::json::value> CallTool(std::string name,
                                                                boost::json::object arguments) = 0;
    virtual boost::asio::awaitable<boost::json::value> ReadResource(std::string uri) = 0;
    virtual boost::asio::awaitable<boost::json::value> GetPrompt(std::string name,
                                                                 boost::json::object arguments) = 0;

    // Copies; never views into session state.
    virtual CapabilitySet Capabilities() const = 0;
    virtual std::vector<Tool> Tools() const = 0;
    virtual std::vector<Resource> Resources() const = 0;
    virtual std::vector<Prompt> Prompts() const = 0;

    virtual boost::asio::awaitable<void> Close() = 0;
    virtual bool IsClosed() const = 0;
    virtual std::size_t InFlight() const = 0;
};

using SessionPtr = std::shared_ptr<ISession>;

}  // namespace switchboard::core
