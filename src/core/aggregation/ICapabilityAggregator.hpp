#pragma once

#include <boost/asio/awaitable.hpp>
#include <string>
#include <vector>

#include "Capabilities.hpp"
#include "IBackendConnection.hpp"

namespace switchboard::core {

/**
 * @brief Discovers and merges the operations exposed by a set of initialized
 * connections into one namespace.
 *
 * Connections arrive in configuration order. Every routing entry produced
 * must name one of the given connections.
 */
class ICapabilityAggregator {
   public:
    virtual ~ICapabilityAggregator() = default;

    virtual boost::asio::awaitable<AggregationResult> Aggregate(
        const std::vector<BackendConnectionPtr>& connections) = 0;

    // Prefix put in front of every tool and prompt name from backend_id, or
    // an empty string when names are exposed unchanged.
    virtual std::string NamePrefix(const std::string& backend_id) const = 0;
};

}  // namespace switchboard::core
