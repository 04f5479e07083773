/**
 * mcpguard tool servers
 *
 * ToolServerConnection is the contract the orchestrator needs from a tool
 * server: list its tools and call one by name. ToolServerRegistry maps
 * server names to their launch configuration and fingerprint, and hands
 * out connections.
 */
#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace mcpguard::bridge {

struct ToolServerConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    nlohmann::json to_json() const;
    static std::optional<ToolServerConfig> from_json(const nlohmann::json& j,
                                                     std::string* error = nullptr);
};

// First 16 hex chars of SHA-256 over {"mcpName":..,"config":{command,args,env}}
std::string config_fingerprint(const std::string& mcp_name, const ToolServerConfig& config);

struct ToolCallOutcome {
    bool ok = false;
    nlohmann::json result;     // MCP tools/call result object when ok
    std::string error;         // server-reported or transport error text
};

class ToolServerConnection {
public:
    virtual ~ToolServerConnection() = default;

    virtual std::optional<std::vector<core::ToolDescriptor>> list_tools(std::string* error) = 0;
    virtual ToolCallOutcome call_tool(const std::string& name, const nlohmann::json& arguments) = 0;

    virtual std::string name() const = 0;
};

using ServerChangeListener = std::function<void(const std::string& mcp_name)>;

class ToolServerRegistry {
public:
    explicit ToolServerRegistry(int request_timeout_ms = 30000);
    ~ToolServerRegistry();

    ToolServerRegistry(const ToolServerRegistry&) = delete;
    ToolServerRegistry& operator=(const ToolServerRegistry&) = delete;

    // {"mcpServers": {name: {command, args, env}}}; servers missing from the
    // document are removed
    bool load_document(const nlohmann::json& doc, std::string* error = nullptr);
    bool load_file(const std::string& path, std::string* error = nullptr);

    // A changed fingerprint drops the live connection and notifies listeners
    void register_server(const std::string& name, const ToolServerConfig& config);

    // Pre-built connection; hash identifies it for the schema cache
    void register_connection(const std::string& name, std::shared_ptr<ToolServerConnection> conn,
                             const std::string& config_hash);

    bool remove_server(const std::string& name);

    bool has_server(const std::string& name) const;
    std::optional<std::string> config_hash(const std::string& name) const;
    std::vector<std::string> server_names() const;

    // Starts the server on first use; nullptr with error set on failure
    std::shared_ptr<ToolServerConnection> connect(const std::string& name, std::string* error);

    void add_change_listener(ServerChangeListener listener);

    void shutdown();

private:
    struct Entry {
        std::optional<ToolServerConfig> config;
        std::string hash;
        std::shared_ptr<ToolServerConnection> connection;
    };

    void notify_changed(const std::string& name);

    int request_timeout_ms_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> servers_;
    std::vector<ServerChangeListener> listeners_;
};

} // namespace mcpguard::bridge
