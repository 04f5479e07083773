#include "kernel/control_service.hpp"
#include "runtime/sandbox_runner.hpp"
#include <spdlog/spdlog.h>
#include <csignal>

using json = nlohmann::json;

namespace mcpguard::kernel {

// Global service pointer for signal handling
static ControlService* g_service = nullptr;

static void signal_handler(int) {
    if (g_service) {
        g_service->shutdown();
    }
}

ControlService::ControlService(const config::OrchestratorConfig& config,
                               std::unique_ptr<config::SettingsStore> settings)
    : config_(config)
    , settings_(settings ? std::move(settings)
                         : config::SettingsStore::open_file(config.resolved_settings_path()))
    , audit_logger_(std::make_unique<AuditLogger>())
    , schema_cache_(std::make_unique<schema::SchemaCache>(*settings_))
    , registry_(std::make_unique<bridge::ToolServerRegistry>(config.tool_call_timeout_ms))
    , socket_server_(std::make_unique<ipc::SocketServer>(config.socket_path))
    , supervisor_(std::make_unique<ExecutionSupervisor>(
          runtime::RunnerOptions::from_config(config), config.max_script_bytes,
          *settings_, *schema_cache_, *registry_, audit_logger_.get()))
{
}

ControlService::~ControlService() {
    if (g_service == this) {
        g_service = nullptr;
    }
    supervisor_.reset();
    registry_->shutdown();
}

bool ControlService::init() {
    spdlog::info("Initializing mcpguard orchestrator...");
    spdlog::info("Settings: {}", settings_->describe());

    if (!config_.servers_path.empty()) {
        std::string error;
        if (!registry_->load_file(config_.servers_path, &error)) {
            spdlog::error("Failed to load tool servers from {}: {}", config_.servers_path, error);
            return false;
        }
    }
    spdlog::info("Tool servers: {}", registry_->server_names().size());

    socket_server_->set_handler([this](ipc::ClientId client, const ipc::Message& msg) {
        return handle_message(client, msg);
    });
    if (!socket_server_->init()) {
        spdlog::error("Failed to initialize control socket");
        return false;
    }

    g_service = this;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    spdlog::info("Isolation: namespaces={}, cgroups={}",
                 config_.enable_namespaces ? "enabled" : "disabled",
                 config_.enable_cgroups ? "enabled" : "disabled");
    return true;
}

void ControlService::run() {
    spdlog::info("mcpguard orchestrator running on {}", config_.socket_path);
    socket_server_->run();

    spdlog::info("Orchestrator shutting down...");
    size_t cancelled = supervisor_->cancel_all();
    if (cancelled > 0) {
        spdlog::info("Cancelling {} in-flight execution(s)", cancelled);
    }
    supervisor_->wait_idle();
    socket_server_->stop();
    registry_->shutdown();
    spdlog::info("Orchestrator stopped");
}

void ControlService::shutdown() {
    socket_server_->request_stop();
}

// ============================================================================
// Dispatch
// ============================================================================

ipc::Message ControlService::reply(const ipc::Message& msg, const json& body) {
    return ipc::Message(msg.request_id, msg.opcode, core::dump_json(body));
}

ipc::Message ControlService::error_reply(const ipc::Message& msg, const std::string& error) {
    return reply(msg, json{{"ok", false}, {"error", error}});
}

std::optional<ipc::Message> ControlService::handle_message(ipc::ClientId client,
                                                           const ipc::Message& msg) {
    json request = json::object();
    if (!msg.payload.empty()) {
        try {
            request = json::parse(msg.payload_str());
        } catch (const json::parse_error& e) {
            return error_reply(msg, std::string("invalid JSON payload: ") + e.what());
        }
    }
    if (!request.is_object() && msg.opcode != ipc::ControlOp::NOOP) {
        return error_reply(msg, "payload must be a JSON object");
    }

    try {
        switch (msg.opcode) {
            case ipc::ControlOp::NOOP:
                return reply(msg, json{{"ok", true}, {"echo", request}});
            case ipc::ControlOp::SUBMIT:
                return handle_submit(client, msg, request);
            case ipc::ControlOp::CANCEL:
                return handle_cancel(msg, request);
            case ipc::ControlOp::INVALIDATE_SCHEMA:
                return handle_invalidate_schema(msg, request);
            case ipc::ControlOp::GET_SCHEMA:
                return handle_get_schema(msg, request);
            case ipc::ControlOp::LIST_ACTIVE:
                return handle_list_active(msg);
            case ipc::ControlOp::GET_AUDIT_LOG:
                return handle_get_audit_log(msg, request);
            case ipc::ControlOp::SHUTDOWN:
                return handle_shutdown(msg);
            default:
                spdlog::warn("Unknown opcode 0x{:02x}", static_cast<int>(msg.opcode));
                return error_reply(msg, "unknown opcode");
        }
    } catch (const json::exception& e) {
        return error_reply(msg, std::string("bad request: ") + e.what());
    }
}

std::optional<ipc::Message> ControlService::handle_submit(ipc::ClientId client,
                                                          const ipc::Message& msg,
                                                          const json& request) {
    std::string error;
    auto exec_request = core::ExecutionRequest::from_json(request, &error);
    if (!exec_request) {
        return error_reply(msg, error);
    }

    uint32_t request_id = msg.request_id;
    ipc::SocketServer* server = socket_server_.get();
    supervisor_->submit_with_callback(std::move(*exec_request),
        [server, client, request_id](core::ExecutionResult result) {
            json body = {{"ok", true}, {"result", result.to_json()}};
            if (!server->post_response(client, ipc::Message(request_id, ipc::ControlOp::SUBMIT,
                                                            core::dump_json(body)))) {
                spdlog::warn("[{}] result dropped: control server stopped", result.id);
            }
        });
    return std::nullopt;
}

ipc::Message ControlService::handle_cancel(const ipc::Message& msg, const json& request) {
    std::string id = request.value("id", "");
    if (id.empty()) {
        return error_reply(msg, "id required");
    }
    bool found = supervisor_->cancel(id);
    return reply(msg, json{{"ok", true}, {"id", id}, {"cancelled", found}});
}

ipc::Message ControlService::handle_invalidate_schema(const ipc::Message& msg, const json& request) {
    std::string mcp_name = request.value("mcpName", "");
    if (mcp_name.empty()) {
        return error_reply(msg, "mcpName required");
    }
    size_t removed = supervisor_->invalidate_schema(mcp_name);
    audit_logger_->log(AuditCategory::SCHEMA_CACHE, "SCHEMA_INVALIDATED", "", mcp_name,
                       {{"removed", removed}});
    return reply(msg, json{{"ok", true}, {"mcpName", mcp_name}, {"removed", removed}});
}

ipc::Message ControlService::handle_get_schema(const ipc::Message& msg, const json& request) {
    std::string mcp_name = request.value("mcpName", "");
    if (mcp_name.empty()) {
        return error_reply(msg, "mcpName required");
    }

    std::string config_hash = request.value("configHash", "");
    if (config_hash.empty()) {
        auto current = registry_->config_hash(mcp_name);
        if (!current) {
            return error_reply(msg, "unknown tool server '" + mcp_name + "'");
        }
        config_hash = *current;
    }

    json body = {{"ok", true}, {"mcpName", mcp_name}, {"configHash", config_hash}};
    auto entry = supervisor_->get_cached_schema(mcp_name, config_hash);
    body["hit"] = entry.has_value();
    if (entry) {
        body["entry"] = entry->to_json();
    }
    return reply(msg, body);
}

ipc::Message ControlService::handle_list_active(const ipc::Message& msg) {
    return reply(msg, json{{"ok", true}, {"ids", supervisor_->active_ids()}});
}

ipc::Message ControlService::handle_get_audit_log(const ipc::Message& msg, const json& request) {
    std::optional<AuditCategory> category;
    std::string category_str = request.value("category", "");
    if (!category_str.empty()) {
        category = audit_category_from_string(category_str);
        if (!category) {
            return error_reply(msg, "unknown audit category '" + category_str + "'");
        }
    }
    std::string execution_id = request.value("executionId", "");
    uint64_t since_id = request.value("sinceId", static_cast<uint64_t>(0));
    size_t limit = request.value("limit", static_cast<size_t>(100));

    auto entries = audit_logger_->get_entries(category, execution_id, since_id, limit);

    json body;
    body["ok"] = true;
    body["count"] = entries.size();
    body["entries"] = json::array();
    for (const auto& entry : entries) {
        body["entries"].push_back(entry.to_json());
    }
    return reply(msg, body);
}

ipc::Message ControlService::handle_shutdown(const ipc::Message& msg) {
    spdlog::info("Shutdown requested over control socket");
    shutdown();
    return reply(msg, json{{"ok", true}});
}

} // namespace mcpguard::kernel
