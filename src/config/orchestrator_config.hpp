/**
 * mcpguard orchestrator configuration
 *
 * Plain settings struct with defaults. Layering order, lowest first:
 * built-in defaults, optional JSON file, MCPGUARD_* environment variables,
 * command-line flags (applied by the CLI).
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace mcpguard::config {

struct OrchestratorConfig {
    std::string socket_path = "/tmp/mcpguard.sock";
    std::string settings_path;      // empty = ~/.mcpguard/settings.json
    std::string servers_path;       // mcpServers document, optional
    std::string scratch_root = "/tmp";

    // argv templates; {artifact}, {workdir}, {memory_mb} and {cpu_ms} are expanded
    std::vector<std::string> build_command = {"node", "--check", "{artifact}"};
    std::vector<std::string> runtime_command = {
        "node", "--disallow-code-generation-from-strings",
        "--max-old-space-size={memory_mb}", "{artifact}"
    };

    int build_timeout_ms = 30000;
    int timeout_grace_ms = 500;
    int tool_call_timeout_ms = 30000;

    size_t max_output_bytes = 1024 * 1024;
    size_t max_script_bytes = 50000;

    bool enable_namespaces = true;
    bool enable_cgroups = true;
    std::string cgroup_root = "/sys/fs/cgroup/mcpguard";

    std::string log_level = "info";

    nlohmann::json to_json() const;

    // Overlays keys present in j; unknown keys are ignored with a warning
    bool apply_json(const nlohmann::json& j, std::string* error = nullptr);

    bool load_file(const std::string& path, std::string* error = nullptr);
    void apply_environment();

    std::string resolved_settings_path() const;

    static std::string default_config_path();
    static std::string home_dir();
};

} // namespace mcpguard::config
