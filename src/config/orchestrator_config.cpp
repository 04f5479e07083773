#include "config/orchestrator_config.hpp"
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mcpguard::config {

using json = nlohmann::json;

namespace {

bool read_string_list(const json& j, const char* key, std::vector<std::string>& out,
                      std::string* error) {
    if (!j[key].is_array() || j[key].empty()) {
        if (error) *error = std::string(key) + " must be a non-empty array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& item : j[key]) {
        if (!item.is_string()) {
            if (error) *error = std::string(key) + " must contain only strings";
            return false;
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return true;
}

bool read_positive_int(const json& j, const char* key, int& out, std::string* error) {
    if (!j[key].is_number_integer() || j[key].get<int64_t>() <= 0) {
        if (error) *error = std::string(key) + " must be a positive integer";
        return false;
    }
    out = j[key].get<int>();
    return true;
}

bool read_size(const json& j, const char* key, size_t& out, std::string* error) {
    if (!j[key].is_number_integer() || j[key].get<int64_t>() <= 0) {
        if (error) *error = std::string(key) + " must be a positive integer";
        return false;
    }
    out = j[key].get<size_t>();
    return true;
}

} // anonymous namespace

json OrchestratorConfig::to_json() const {
    return {
        {"socket_path", socket_path},
        {"settings_path", resolved_settings_path()},
        {"servers_path", servers_path},
        {"scratch_root", scratch_root},
        {"build_command", build_command},
        {"runtime_command", runtime_command},
        {"build_timeout_ms", build_timeout_ms},
        {"timeout_grace_ms", timeout_grace_ms},
        {"tool_call_timeout_ms", tool_call_timeout_ms},
        {"max_output_bytes", max_output_bytes},
        {"max_script_bytes", max_script_bytes},
        {"enable_namespaces", enable_namespaces},
        {"enable_cgroups", enable_cgroups},
        {"cgroup_root", cgroup_root},
        {"log_level", log_level}
    };
}

bool OrchestratorConfig::apply_json(const json& j, std::string* error) {
    if (!j.is_object()) {
        if (error) *error = "configuration must be a JSON object";
        return false;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();

        if (key == "socket_path" || key == "settings_path" || key == "servers_path" ||
            key == "scratch_root" || key == "cgroup_root" || key == "log_level") {
            if (!value.is_string()) {
                if (error) *error = key + " must be a string";
                return false;
            }
            std::string s = value.get<std::string>();
            if (key == "socket_path") socket_path = s;
            else if (key == "settings_path") settings_path = s;
            else if (key == "servers_path") servers_path = s;
            else if (key == "scratch_root") scratch_root = s;
            else if (key == "cgroup_root") cgroup_root = s;
            else log_level = s;
        } else if (key == "build_command") {
            if (!read_string_list(j, "build_command", build_command, error)) return false;
        } else if (key == "runtime_command") {
            if (!read_string_list(j, "runtime_command", runtime_command, error)) return false;
        } else if (key == "build_timeout_ms") {
            if (!read_positive_int(j, "build_timeout_ms", build_timeout_ms, error)) return false;
        } else if (key == "timeout_grace_ms") {
            if (!value.is_number_integer() || value.get<int64_t>() < 0) {
                if (error) *error = "timeout_grace_ms must be a non-negative integer";
                return false;
            }
            timeout_grace_ms = value.get<int>();
        } else if (key == "tool_call_timeout_ms") {
            if (!read_positive_int(j, "tool_call_timeout_ms", tool_call_timeout_ms, error)) return false;
        } else if (key == "max_output_bytes") {
            if (!read_size(j, "max_output_bytes", max_output_bytes, error)) return false;
        } else if (key == "max_script_bytes") {
            if (!read_size(j, "max_script_bytes", max_script_bytes, error)) return false;
        } else if (key == "enable_namespaces" || key == "enable_cgroups") {
            if (!value.is_boolean()) {
                if (error) *error = key + " must be a boolean";
                return false;
            }
            (key == "enable_namespaces" ? enable_namespaces : enable_cgroups) = value.get<bool>();
        } else {
            spdlog::warn("Ignoring unknown configuration key '{}'", key);
        }
    }
    return true;
}

bool OrchestratorConfig::load_file(const std::string& path, std::string* error) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        if (error) *error = "cannot open " + path;
        return false;
    }

    json j;
    try {
        j = json::parse(ifs);
    } catch (const json::parse_error& e) {
        if (error) *error = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!apply_json(j, error)) {
        return false;
    }
    spdlog::debug("Loaded orchestrator configuration from {}", path);
    return true;
}

void OrchestratorConfig::apply_environment() {
    if (const char* level = std::getenv("MCPGUARD_LOG_LEVEL")) {
        log_level = level;
    }
    if (const char* scratch = std::getenv("MCPGUARD_SCRATCH_DIR")) {
        scratch_root = scratch;
    }
    if (const char* settings = std::getenv("MCPGUARD_SETTINGS")) {
        settings_path = settings;
    }
}

std::string OrchestratorConfig::resolved_settings_path() const {
    if (!settings_path.empty()) {
        return settings_path;
    }
    return home_dir() + "/.mcpguard/settings.json";
}

std::string OrchestratorConfig::default_config_path() {
    return home_dir() + "/.mcpguard/orchestrator.json";
}

std::string OrchestratorConfig::home_dir() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return home;
    }
    if (struct passwd* pw = getpwuid(getuid())) {
        return pw->pw_dir;
    }
    return fs::temp_directory_path().string();
}

} // namespace mcpguard::config
