#pragma once
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "bridge/tool_server.hpp"

namespace mcpguard::tests {

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "mcpguard-test");
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

void write_text(const std::filesystem::path& path, const std::string& content);
std::string read_text(const std::filesystem::path& path);

// Writes a #!/bin/sh script and marks it executable
void write_executable(const std::filesystem::path& path, const std::string& body);

// Short /tmp path; sun_path is limited to 108 bytes
std::string short_socket_path(const std::string& prefix);

bool node_available();

// Polls pred every 10 ms until it holds or timeout_ms elapses
bool wait_until(const std::function<bool()>& pred, int timeout_ms);

// Minimal MCP server over stdio in POSIX sh. Exposes tools "echo" and
// "add". A call to "fail" answers with a JSON-RPC error.
std::string fake_mcp_server_script();

// In-process tool server: lists the given tools; call_tool answers with
// {"tool": name, "args": arguments}; a tool named "fail" reports an error
class FakeConnection : public bridge::ToolServerConnection {
public:
    explicit FakeConnection(std::vector<std::string> tool_names, std::string name = "fake");

    std::optional<std::vector<core::ToolDescriptor>> list_tools(std::string* error) override;
    bridge::ToolCallOutcome call_tool(const std::string& name, const nlohmann::json& arguments) override;
    std::string name() const override { return name_; }

    int list_count() const;
    std::vector<std::string> calls() const;

    bool unavailable = false;

private:
    std::vector<std::string> tool_names_;
    std::string name_;
    mutable std::mutex mutex_;
    int list_count_ = 0;
    std::vector<std::string> calls_;
};

} // namespace mcpguard::tests
