#include "bridge/tool_server.hpp"
#include "bridge/stdio_tool_server.hpp"
#include "util/hash.hpp"
#include <spdlog/spdlog.h>
#include <fmt/ranges.h>

#include <fstream>

namespace mcpguard::bridge {

using json = nlohmann::json;

// ============================================================================
// ToolServerConfig
// ============================================================================

json ToolServerConfig::to_json() const {
    json j;
    j["command"] = command;
    j["args"] = args;
    if (!env.empty()) {
        j["env"] = env;
    }
    return j;
}

std::optional<ToolServerConfig> ToolServerConfig::from_json(const json& j, std::string* error) {
    if (!j.is_object()) {
        if (error) *error = "server entry must be an object";
        return std::nullopt;
    }
    if (!j.contains("command") || !j["command"].is_string() ||
        j["command"].get<std::string>().empty()) {
        if (error) *error = "server entry needs a non-empty 'command'";
        return std::nullopt;
    }

    ToolServerConfig config;
    config.command = j["command"].get<std::string>();

    if (j.contains("args")) {
        if (!j["args"].is_array()) {
            if (error) *error = "'args' must be an array";
            return std::nullopt;
        }
        for (const auto& arg : j["args"]) {
            if (!arg.is_string()) {
                if (error) *error = "'args' must contain only strings";
                return std::nullopt;
            }
            config.args.push_back(arg.get<std::string>());
        }
    }

    if (j.contains("env") && !j["env"].is_null()) {
        if (!j["env"].is_object()) {
            if (error) *error = "'env' must be an object";
            return std::nullopt;
        }
        for (auto it = j["env"].begin(); it != j["env"].end(); ++it) {
            if (!it.value().is_string()) {
                if (error) *error = "env value for '" + it.key() + "' must be a string";
                return std::nullopt;
            }
            config.env[it.key()] = it.value().get<std::string>();
        }
    }
    return config;
}

std::string config_fingerprint(const std::string& mcp_name, const ToolServerConfig& config) {
    // Key order is part of the fingerprint
    nlohmann::ordered_json cfg;
    cfg["command"] = config.command;
    cfg["args"] = config.args;
    if (!config.env.empty()) {
        nlohmann::ordered_json env = nlohmann::ordered_json::object();
        for (const auto& [key, value] : config.env) {
            env[key] = value;
        }
        cfg["env"] = env;
    }

    nlohmann::ordered_json doc;
    doc["mcpName"] = mcp_name;
    doc["config"] = cfg;

    auto digest = util::sha256_hex(doc.dump());
    if (!digest) {
        // Unhashable config never matches a cached entry
        return "unhashed";
    }
    return digest->substr(0, 16);
}

// ============================================================================
// ToolServerRegistry
// ============================================================================

ToolServerRegistry::ToolServerRegistry(int request_timeout_ms)
    : request_timeout_ms_(request_timeout_ms) {}

ToolServerRegistry::~ToolServerRegistry() {
    shutdown();
}

bool ToolServerRegistry::load_document(const json& doc, std::string* error) {
    if (!doc.is_object() || !doc.contains("mcpServers") || !doc["mcpServers"].is_object()) {
        if (error) *error = "document has no 'mcpServers' object";
        return false;
    }

    std::map<std::string, ToolServerConfig> parsed;
    for (auto it = doc["mcpServers"].begin(); it != doc["mcpServers"].end(); ++it) {
        std::string entry_error;
        auto config = ToolServerConfig::from_json(it.value(), &entry_error);
        if (!config) {
            spdlog::warn("Skipping tool server '{}': {}", it.key(), entry_error);
            continue;
        }
        parsed[it.key()] = std::move(*config);
    }

    for (const auto& name : server_names()) {
        if (!parsed.count(name)) {
            remove_server(name);
        }
    }
    for (const auto& [name, config] : parsed) {
        register_server(name, config);
    }

    spdlog::info("Loaded {} tool server definitions", parsed.size());
    return true;
}

bool ToolServerRegistry::load_file(const std::string& path, std::string* error) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        if (error) *error = "cannot open " + path;
        return false;
    }
    try {
        return load_document(json::parse(ifs), error);
    } catch (const json::parse_error& e) {
        if (error) *error = "invalid JSON in " + path + ": " + e.what();
        return false;
    }
}

void ToolServerRegistry::register_server(const std::string& name, const ToolServerConfig& config) {
    std::string hash = config_fingerprint(name, config);
    bool changed = false;
    std::shared_ptr<ToolServerConnection> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(name);
        if (it != servers_.end()) {
            if (it->second.hash == hash) {
                return;
            }
            changed = true;
            stale = std::move(it->second.connection);
        }
        Entry entry;
        entry.config = config;
        entry.hash = hash;
        servers_[name] = std::move(entry);
    }

    // Only keys are logged; env values may hold credentials
    std::vector<std::string> env_keys;
    for (const auto& [key, _] : config.env) {
        env_keys.push_back(key);
    }
    spdlog::info("Registered tool server {} (command={}, args={}, envKeys=[{}], hash={})",
                 name, config.command, config.args.size(),
                 fmt::join(env_keys, ","), hash);

    if (changed) {
        notify_changed(name);
    }
}

void ToolServerRegistry::register_connection(const std::string& name,
                                             std::shared_ptr<ToolServerConnection> conn,
                                             const std::string& config_hash) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(name);
        changed = it != servers_.end() && it->second.hash != config_hash;
        Entry entry;
        entry.hash = config_hash;
        entry.connection = std::move(conn);
        servers_[name] = std::move(entry);
    }
    spdlog::debug("Registered tool server connection {} (hash={})", name, config_hash);
    if (changed) {
        notify_changed(name);
    }
}

bool ToolServerRegistry::remove_server(const std::string& name) {
    std::shared_ptr<ToolServerConnection> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(name);
        if (it == servers_.end()) {
            return false;
        }
        removed = std::move(it->second.connection);
        servers_.erase(it);
    }
    spdlog::info("Removed tool server {}", name);
    notify_changed(name);
    return true;
}

bool ToolServerRegistry::has_server(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.count(name) > 0;
}

std::optional<std::string> ToolServerRegistry::config_hash(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(name);
    if (it == servers_.end()) {
        return std::nullopt;
    }
    return it->second.hash;
}

std::vector<std::string> ToolServerRegistry::server_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : servers_) {
        names.push_back(name);
    }
    return names;
}

std::shared_ptr<ToolServerConnection> ToolServerRegistry::connect(const std::string& name,
                                                                  std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(name);
    if (it == servers_.end()) {
        if (error) *error = "tool server '" + name + "' is not configured";
        return nullptr;
    }

    Entry& entry = it->second;
    if (entry.connection) {
        auto* stdio = dynamic_cast<StdioToolServer*>(entry.connection.get());
        if (!stdio || stdio->is_running()) {
            return entry.connection;
        }
        spdlog::warn("Tool server {} exited; restarting", name);
        entry.connection.reset();
    }

    if (!entry.config) {
        if (error) *error = "tool server '" + name + "' has no launch configuration";
        return nullptr;
    }

    auto server = std::make_shared<StdioToolServer>(name, *entry.config, request_timeout_ms_);
    std::string start_error;
    if (!server->start(&start_error)) {
        if (error) *error = "cannot start tool server '" + name + "': " + start_error;
        return nullptr;
    }
    entry.connection = server;
    return entry.connection;
}

void ToolServerRegistry::add_change_listener(ServerChangeListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void ToolServerRegistry::notify_changed(const std::string& name) {
    std::vector<ServerChangeListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        listener(name);
    }
}

void ToolServerRegistry::shutdown() {
    std::map<std::string, Entry> servers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, entry] : servers_) {
            if (entry.connection) {
                servers[name].connection = std::move(entry.connection);
            }
        }
    }
    for (auto& [name, entry] : servers) {
        if (auto* stdio = dynamic_cast<StdioToolServer*>(entry.connection.get())) {
            stdio->stop();
        }
    }
}

} // namespace mcpguard::bridge
