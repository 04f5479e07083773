#include "policy/policy_resolver.hpp"
#include "policy/capabilities.hpp"
#include "config/settings_store.hpp"
#include <spdlog/spdlog.h>

namespace mcpguard::policy {

using json = nlohmann::json;

namespace {

constexpr int64_t DEFAULT_CPU_MS = 30000;
constexpr int64_t DEFAULT_MEMORY_MB = 128;
constexpr int64_t DEFAULT_MAX_TOOL_CALLS = 100;

bool read_bool(const json& obj, const char* key, bool fallback) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_boolean()) {
        return obj[key].get<bool>();
    }
    return fallback;
}

std::vector<std::string> read_strings(const json& obj, const char* key) {
    std::vector<std::string> out;
    if (!obj.is_object() || !obj.contains(key) || !obj[key].is_array()) {
        return out;
    }
    for (const auto& item : obj[key]) {
        if (item.is_string() && !item.get<std::string>().empty()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

int64_t read_limit(const json& limits, const char* key, int64_t fallback,
                   const std::string& mcp_name) {
    if (!limits.is_object() || !limits.contains(key)) {
        return fallback;
    }
    const auto& v = limits[key];
    if (v.is_number() && v.get<double>() > 0) {
        return v.get<int64_t>();
    }
    spdlog::warn("Policy for {}: resourceLimits.{} = {} is not a positive number, using {}",
                 mcp_name, key, v.dump(), fallback);
    return fallback;
}

} // anonymous namespace

PolicyResolver::PolicyResolver(const config::SettingsStore& settings)
    : settings_(settings) {}

core::IsolationPolicy PolicyResolver::resolve(const std::string& mcp_name) const {
    json doc = settings_.snapshot();

    json defaults = doc.contains(config::SECTION_DEFAULTS) ? doc[config::SECTION_DEFAULTS]
                                                           : json(nullptr);
    json configs = doc.contains(config::SECTION_MCP_CONFIGS) ? doc[config::SECTION_MCP_CONFIGS]
                                                             : json(nullptr);
    bool enabled = read_bool(doc, config::SECTION_ENABLED, true);

    return resolve(mcp_name, defaults, find_override(configs, mcp_name), enabled);
}

core::IsolationPolicy PolicyResolver::resolve(const std::string& mcp_name,
                                              const json& defaults,
                                              const json& override_config,
                                              bool isolation_enabled) {
    json effective = builtin_defaults();
    if (defaults.is_object()) {
        effective = merge(effective, defaults);
    }
    if (override_config.is_object()) {
        // Only the policy sections of an mcpConfigs entry take part
        for (const char* section : {"network", "fileSystem", "resourceLimits"}) {
            if (override_config.contains(section)) {
                json partial;
                partial[section] = override_config[section];
                effective = merge(effective, partial);
            }
        }
    }

    core::IsolationPolicy policy;
    policy.mcp_name = mcp_name;
    policy.isolation_enabled = isolation_enabled;

    const json& net = effective["network"];
    bool network_enabled = read_bool(net, "enabled", false);
    if (network_enabled) {
        std::set<std::string> hosts;
        for (const auto& host : read_strings(net, "allowlist")) {
            std::string normalized = CapabilityChecker::normalize_host(host);
            if (!normalized.empty()) {
                hosts.insert(normalized);
            }
        }
        if (!hosts.empty()) {
            policy.network.allowed_hosts = std::move(hosts);
        }
    }
    policy.network.allow_localhost = network_enabled && read_bool(net, "allowLocalhost", false);

    const json& fsj = effective["fileSystem"];
    policy.file_system.enabled = read_bool(fsj, "enabled", false);
    policy.file_system.read_paths = read_strings(fsj, "readPaths");
    policy.file_system.write_paths = read_strings(fsj, "writePaths");

    const json& limits = effective["resourceLimits"];
    policy.limits.cpu_ms = read_limit(limits, "maxExecutionTimeMs", DEFAULT_CPU_MS, mcp_name);
    policy.limits.memory_mb = read_limit(limits, "maxMemoryMB", DEFAULT_MEMORY_MB, mcp_name);
    policy.limits.max_tool_calls = read_limit(limits, "maxMCPCalls", DEFAULT_MAX_TOOL_CALLS, mcp_name);

    spdlog::debug("Resolved policy for {}: network={} hosts={} fs={} cpu={}ms mem={}MB calls={}",
                  mcp_name, network_enabled,
                  policy.network.allowed_hosts ? policy.network.allowed_hosts->size() : 0,
                  policy.file_system.enabled, policy.limits.cpu_ms,
                  policy.limits.memory_mb, policy.limits.max_tool_calls);
    return policy;
}

json PolicyResolver::builtin_defaults() {
    return {
        {"network", {
            {"enabled", false},
            {"allowlist", json::array()},
            {"allowLocalhost", false}
        }},
        {"fileSystem", {
            {"enabled", false},
            {"readPaths", json::array()},
            {"writePaths", json::array()}
        }},
        {"resourceLimits", {
            {"maxExecutionTimeMs", DEFAULT_CPU_MS},
            {"maxMemoryMB", DEFAULT_MEMORY_MB},
            {"maxMCPCalls", DEFAULT_MAX_TOOL_CALLS}
        }}
    };
}

json PolicyResolver::merge(const json& base, const json& overlay) {
    if (!base.is_object() || !overlay.is_object()) {
        return overlay;
    }
    json out = base;
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        if (out.contains(it.key()) && out[it.key()].is_object() && it.value().is_object()) {
            out[it.key()] = merge(out[it.key()], it.value());
        } else if (!it.value().is_null()) {
            out[it.key()] = it.value();
        }
    }
    return out;
}

json PolicyResolver::find_override(const json& mcp_configs, const std::string& mcp_name) {
    if (!mcp_configs.is_array()) {
        return nullptr;
    }
    for (const auto& entry : mcp_configs) {
        if (entry.is_object() && entry.contains("mcpName") && entry["mcpName"].is_string() &&
            entry["mcpName"].get<std::string>() == mcp_name) {
            return entry;
        }
    }
    return nullptr;
}

} // namespace mcpguard::policy
