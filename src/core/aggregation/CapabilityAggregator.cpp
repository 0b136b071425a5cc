#include "CapabilityAggregator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <unordered_set>

#include "BoundedParallel.hpp"

namespace switchboard::core {

CapabilityAggregator::CapabilityAggregator(AggregationConfig cfg,
                                           const std::vector<BackendTarget>& backends)
    : cfg_(std::move(cfg)) {
    for (const auto& b : backends) {
        targets_.emplace(b.id, b);
    }
}

boost::asio::awaitable<AggregationResult> CapabilityAggregator::Aggregate(
    const std::vector<BackendConnectionPtr>& connections) {
    std::vector<BackendCapabilities> discovered(connections.size());
    std::vector<std::optional<std::string>> failures(connections.size());

    co_await infra::RunBounded(
        connections.size(), connections.size(),
        [&](std::size_t i) -> boost::asio::awaitable<void> {
            const auto& conn = connections[i];
            discovered[i].backend_id = conn->BackendId();
            try {
                discovered[i].tools = co_await conn->ListTools();
                discovered[i].resources = co_await conn->ListResources();
                discovered[i].prompts = co_await conn->ListPrompts();
            } catch (const std::exception& e) {
                failures[i] = e.what();
            }
        });

    std::vector<BackendCapabilities> usable;
    std::map<std::string, std::string> errors;
    for (std::size_t i = 0; i < connections.size(); ++i) {
        if (failures[i]) {
            spdlog::warn("Capability discovery failed for backend '{}': {}",
                         discovered[i].backend_id, *failures[i]);
            errors.emplace(discovered[i].backend_id, *failures[i]);
            continue;
        }
        usable.push_back(std::move(discovered[i]));
    }

    auto result = Merge(std::move(usable));
    result.backend_errors = std::move(errors);
    co_return result;
}

std::string CapabilityAggregator::ExposedName(const std::string& backend_id,
                                              const std::string& name) const {
    if (cfg_.strategy != AggregationConfig::Strategy::prefix) {
        return name;
    }
    std::string prefix = cfg_.prefix_format;
    const std::string placeholder = "{workload}";
    for (auto pos = prefix.find(placeholder); pos != std::string::npos;
         pos = prefix.find(placeholder, pos + backend_id.size())) {
        prefix.replace(pos, placeholder.size(), backend_id);
    }
    return prefix + name;
}

std::string CapabilityAggregator::NamePrefix(const std::string& backend_id) const {
    return ExposedName(backend_id, "");
}

void CapabilityAggregator::OrderByPriority(std::vector<BackendCapabilities>& discovered) const {
    if (cfg_.strategy != AggregationConfig::Strategy::priority || cfg_.priority_order.empty()) {
        return;
    }
    auto rank = [this](const std::string& id) {
        auto it = std::find(cfg_.priority_order.begin(), cfg_.priority_order.end(), id);
        return static_cast<std::size_t>(it - cfg_.priority_order.begin());
    };
    std::stable_sort(discovered.begin(), discovered.end(),
                     [&](const BackendCapabilities& a, const BackendCapabilities& b) {
                         return rank(a.backend_id) < rank(b.backend_id);
                     });
}

void CapabilityAggregator::ApplyToolPolicy(
    BackendCapabilities& caps, std::unordered_map<std::string, std::string>& renamed_from) const {
    auto it = targets_.find(caps.backend_id);
    if (it == targets_.end()) {
        return;
    }
    const auto& target = it->second;

    if (!target.tool_filter.empty()) {
        std::erase_if(caps.tools, [&](const Tool& t) {
            return std::find(target.tool_filter.begin(), target.tool_filter.end(), t.name) ==
                   target.tool_filter.end();
        });
    }

    for (auto& tool : caps.tools) {
        auto ov = target.tool_overrides.find(tool.name);
        if (ov == target.tool_overrides.end()) {
            continue;
        }
        if (!ov->second.description.empty()) {
            tool.description = ov->second.description;
        }
        if (!ov->second.name.empty()) {
            renamed_from[ov->second.name] = tool.name;
            tool.name = ov->second.name;
        }
    }
}

AggregationResult CapabilityAggregator::Merge(std::vector<BackendCapabilities> discovered) const {
    OrderByPriority(discovered);

    AggregationResult result;
    auto& routing = result.routing;
    auto& caps = result.capabilities;

    for (auto& backend : discovered) {
        std::unordered_map<std::string, std::string> renamed_from;
        ApplyToolPolicy(backend, renamed_from);

        for (auto& tool : backend.tools) {
            const std::string original =
                renamed_from.contains(tool.name) ? renamed_from[tool.name] : tool.name;
            std::string exposed = ExposedName(backend.backend_id, tool.name);

            if (routing.tools.contains(exposed)) {
                spdlog::debug("Tool '{}' from backend '{}' shadowed by backend '{}'", exposed,
                              backend.backend_id, routing.tools[exposed].backend_id);
                continue;
            }
            routing.tools.emplace(exposed, RoutingEntry{exposed, backend.backend_id, original});
            tool.name = std::move(exposed);
            caps.tools.push_back(std::move(tool));
        }

        for (auto& prompt : backend.prompts) {
            std::string exposed = ExposedName(backend.backend_id, prompt.name);
            if (routing.prompts.contains(exposed)) {
                spdlog::debug("Prompt '{}' from backend '{}' shadowed by backend '{}'", exposed,
                              backend.backend_id, routing.prompts[exposed].backend_id);
                continue;
            }
            routing.prompts.emplace(exposed,
                                    RoutingEntry{exposed, backend.backend_id, prompt.name});
            prompt.name = std::move(exposed);
            caps.prompts.push_back(std::move(prompt));
        }

        for (auto& resource : backend.resources) {
            if (routing.resources.contains(resource.uri)) {
                spdlog::debug("Resource '{}' from backend '{}' shadowed by backend '{}'",
                              resource.uri, backend.backend_id,
                              routing.resources[resource.uri].backend_id);
                continue;
            }
            routing.resources.emplace(
                resource.uri, RoutingEntry{resource.uri, backend.backend_id, resource.uri});
            caps.resources.push_back(std::move(resource));
        }
    }

    spdlog::debug("Aggregated {} tool(s), {} resource(s), {} prompt(s) from {} backend(s)",
                  caps.tools.size(), caps.resources.size(), caps.prompts.size(),
                  discovered.size());
    return result;
}

}  // namespace switchboard::core
