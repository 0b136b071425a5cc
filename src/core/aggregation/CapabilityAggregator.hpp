#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "BackendTarget.hpp"
#include "ICapabilityAggregator.hpp"

namespace switchboard::core {

struct AggregationConfig {
    enum class Strategy { prefix, priority };

    Strategy strategy = Strategy::prefix;
    std::string prefix_format = "{workload}_";  // {workload} is the backend id
    std::vector<std::string> priority_order;
};

// Capabilities of one backend, with original names.
struct BackendCapabilities {
    std::string backend_id;
    std::vector<Tool> tools;
    std::vector<Resource> resources;
    std::vector<Prompt> prompts;
};

/**
 * @brief Default aggregator.
 *
 * Queries every connection concurrently, applies the per-backend tool filter
 * and overrides, then resolves name collisions for tools and prompts with the
 * configured strategy. Resources are keyed by URI; the first backend wins.
 */
class CapabilityAggregator : public ICapabilityAggregator {
   public:
    CapabilityAggregator(AggregationConfig cfg, const std::vector<BackendTarget>& backends);

    boost::asio::awaitable<AggregationResult> Aggregate(
        const std::vector<BackendConnectionPtr>& connections) override;

    std::string NamePrefix(const std::string& backend_id) const override;

    // Deterministic merge step; `discovered` is in configuration order.
    AggregationResult Merge(std::vector<BackendCapabilities> discovered) const;

   private:
    std::string ExposedName(const std::string& backend_id, const std::string& name) const;
    void OrderByPriority(std::vector<BackendCapabilities>& discovered) const;
    void ApplyToolPolicy(BackendCapabilities& caps,
                         std::unordered_map<std::string, std::string>& renamed_from) const;

    AggregationConfig cfg_;
    std::unordered_map<std::string, BackendTarget> targets_;
};

}  // namespace switchboard::core
