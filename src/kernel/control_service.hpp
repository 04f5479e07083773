/**
 * mcpguard ControlService
 *
 * The long-running orchestrator behind `mcpguard serve`. Owns every shared
 * subsystem and exposes the public API over the control socket:
 * - SettingsStore (policy defaults, schema cache section)
 * - SchemaCache and ToolServerRegistry
 * - AuditLogger
 * - ExecutionSupervisor
 * - SocketServer (framed control protocol)
 */
#pragma once
#include <string>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>
#include "config/orchestrator_config.hpp"
#include "config/settings_store.hpp"
#include "schema/schema_cache.hpp"
#include "bridge/tool_server.hpp"
#include "kernel/audit_log.hpp"
#include "kernel/execution_supervisor.hpp"
#include "ipc/socket_server.hpp"

namespace mcpguard::kernel {

class ControlService {
public:
    // settings == nullptr opens the file store at config.resolved_settings_path()
    explicit ControlService(const config::OrchestratorConfig& config,
                            std::unique_ptr<config::SettingsStore> settings = nullptr);
    ~ControlService();

    ControlService(const ControlService&) = delete;
    ControlService& operator=(const ControlService&) = delete;

    // Loads tool servers, binds the socket, installs SIGINT/SIGTERM handlers
    bool init();

    // Serves until shutdown(); then cancels in-flight executions
    void run();

    // Safe from a signal handler
    void shutdown();

    // Dispatch entry point; nullopt means the response is posted later
    std::optional<ipc::Message> handle_message(ipc::ClientId client, const ipc::Message& msg);

    ExecutionSupervisor& supervisor() { return *supervisor_; }
    AuditLogger& audit_logger() { return *audit_logger_; }
    bridge::ToolServerRegistry& registry() { return *registry_; }
    schema::SchemaCache& schema_cache() { return *schema_cache_; }
    const config::OrchestratorConfig& config() const { return config_; }

private:
    std::optional<ipc::Message> handle_submit(ipc::ClientId client, const ipc::Message& msg,
                                              const nlohmann::json& request);
    ipc::Message handle_cancel(const ipc::Message& msg, const nlohmann::json& request);
    ipc::Message handle_invalidate_schema(const ipc::Message& msg, const nlohmann::json& request);
    ipc::Message handle_get_schema(const ipc::Message& msg, const nlohmann::json& request);
    ipc::Message handle_list_active(const ipc::Message& msg);
    ipc::Message handle_get_audit_log(const ipc::Message& msg, const nlohmann::json& request);
    ipc::Message handle_shutdown(const ipc::Message& msg);

    static ipc::Message reply(const ipc::Message& msg, const nlohmann::json& body);
    static ipc::Message error_reply(const ipc::Message& msg, const std::string& error);

    config::OrchestratorConfig config_;
    std::unique_ptr<config::SettingsStore> settings_;
    std::unique_ptr<AuditLogger> audit_logger_;
    std::unique_ptr<schema::SchemaCache> schema_cache_;
    std::unique_ptr<bridge::ToolServerRegistry> registry_;
    std::unique_ptr<ipc::SocketServer> socket_server_;
    // Declared last: destroyed first, while the socket server and registry
    // its workers report to are still alive
    std::unique_ptr<ExecutionSupervisor> supervisor_;
};

} // namespace mcpguard::kernel
