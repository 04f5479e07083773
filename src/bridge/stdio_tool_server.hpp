/**
 * mcpguard StdioToolServer
 *
 * MCP client for a tool server launched as a child process, speaking
 * newline-delimited JSON-RPC 2.0 over its stdin/stdout. The handshake
 * (initialize, notifications/initialized) runs in start(); each exchange
 * afterwards is serialized under one mutex.
 */
#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <optional>
#include <sys/types.h>
#include "bridge/tool_server.hpp"

namespace mcpguard::bridge {

constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";
constexpr const char* MCP_CLIENT_NAME = "mcpguard";
constexpr const char* MCP_CLIENT_VERSION = "0.1.0";

class StdioToolServer : public ToolServerConnection {
public:
    StdioToolServer(std::string name, ToolServerConfig config, int request_timeout_ms = 30000);
    ~StdioToolServer() override;

    StdioToolServer(const StdioToolServer&) = delete;
    StdioToolServer& operator=(const StdioToolServer&) = delete;

    bool start(std::string* error);
    void stop();
    // Lock-free; cleared once the pipes report EOF or stop() runs
    bool is_running() const { return alive_.load(); }

    std::optional<std::vector<core::ToolDescriptor>> list_tools(std::string* error) override;
    ToolCallOutcome call_tool(const std::string& name, const nlohmann::json& arguments) override;
    std::string name() const override { return name_; }

    pid_t pid() const { return pid_; }
    const nlohmann::json& server_info() const { return server_info_; }

private:
    bool spawn(std::string* error);
    void stop_locked();

    // Caller holds mutex_; returns the "result" member or nullopt with error set
    std::optional<nlohmann::json> request_locked(const std::string& method,
                                                 const nlohmann::json& params,
                                                 std::string* error);
    bool notify_locked(const std::string& method, const nlohmann::json& params);

    bool write_line(const std::string& line);
    std::optional<std::string> read_line(int timeout_ms, std::string* error);

    std::string name_;
    ToolServerConfig config_;
    int request_timeout_ms_;

    mutable std::mutex mutex_;
    std::atomic<bool> alive_{false};
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::string read_buffer_;
    int64_t next_id_ = 1;
    bool initialized_ = false;
    nlohmann::json server_info_;
};

} // namespace mcpguard::bridge
