/**
 * mcpguard PolicyResolver
 *
 * Builds the immutable IsolationPolicy for one tool server by overlaying
 * the server's mcpConfigs entry onto the global defaults. Objects merge
 * per leaf field; arrays and scalars replace. Pure: reads settings, never
 * writes them.
 */
#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace mcpguard::config {
class SettingsStore;
}

namespace mcpguard::policy {

class PolicyResolver {
public:
    explicit PolicyResolver(const config::SettingsStore& settings);

    core::IsolationPolicy resolve(const std::string& mcp_name) const;

    // override_config may be null when the server was never configured
    static core::IsolationPolicy resolve(const std::string& mcp_name,
                                         const nlohmann::json& defaults,
                                         const nlohmann::json& override_config,
                                         bool isolation_enabled);

    // network off, filesystem off, 30000 ms / 128 MB / 100 calls
    static nlohmann::json builtin_defaults();

    // Recursive object merge; anything that is not an object on both sides
    // is replaced by the overlay value
    static nlohmann::json merge(const nlohmann::json& base, const nlohmann::json& overlay);

    // Finds the mcpConfigs entry for mcp_name, null if absent
    static nlohmann::json find_override(const nlohmann::json& mcp_configs,
                                        const std::string& mcp_name);

private:
    const config::SettingsStore& settings_;
};

} // namespace mcpguard::policy
