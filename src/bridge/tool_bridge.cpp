#include "bridge/tool_bridge.hpp"
#include "kernel/audit_log.hpp"
#include "policy/capabilities.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace mcpguard::bridge {

using json = nlohmann::json;
using core::ErrorKind;
using kernel::AuditCategory;

ToolBridge::ToolBridge(std::string execution_id,
                       std::shared_ptr<const core::IsolationPolicy> policy,
                       std::set<std::string> tool_names,
                       std::shared_ptr<ToolServerConnection> connection,
                       kernel::AuditLogger* audit,
                       std::shared_ptr<OutboundFetcher> fetcher)
    : execution_id_(std::move(execution_id)),
      policy_(std::move(policy)),
      tool_names_(std::move(tool_names)),
      connection_(std::move(connection)),
      audit_(audit),
      fetcher_(std::move(fetcher)) {}

// ============================================================================
// Tool calls
// ============================================================================

BridgeReply ToolBridge::call_tool(const std::string& tool_name, const json& arguments) {
    const json args = arguments.is_null() ? json::object() : arguments;

    if (!tool_names_.count(tool_name)) {
        auto reply = BridgeReply::denied(ErrorKind::UNKNOWN_TOOL,
            fmt::format("tool '{}' is not provided by {}", tool_name, policy_->mcp_name));
        record(tool_name, args, reply);
        return reply;
    }

    bool over_budget = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int64_t>(ledger_used_) >= policy_->limits.max_tool_calls) {
            over_budget = true;
        } else {
            ledger_used_++;
        }
    }
    if (over_budget) {
        auto reply = BridgeReply::denied(ErrorKind::CALL_BUDGET_EXCEEDED,
            fmt::format("tool call budget of {} exhausted", policy_->limits.max_tool_calls));
        if (audit_) {
            audit_->log_security("CALL_BUDGET_EXCEEDED", execution_id_, policy_->mcp_name,
                                 {{"tool", tool_name}, {"limit", policy_->limits.max_tool_calls}});
        }
        record(tool_name, args, reply);
        return reply;
    }

    BridgeReply reply;
    if (!connection_) {
        reply = BridgeReply::denied(ErrorKind::TOOL_ERROR, "no tool server connection");
    } else {
        ToolCallOutcome outcome = connection_->call_tool(tool_name, args);
        if (outcome.ok) {
            reply = BridgeReply::success(outcome.result);
        } else {
            reply = BridgeReply::denied(ErrorKind::TOOL_ERROR, outcome.error);
            if (!outcome.result.is_null()) {
                reply.value = outcome.result;
            }
        }
    }

    record(tool_name, args, reply);
    return reply;
}

void ToolBridge::record(const std::string& tool_name, const json& arguments,
                        const BridgeReply& reply) {
    core::ToolCallRecord rec;
    rec.tool_name = tool_name;
    rec.arguments = arguments;
    rec.success = reply.ok;
    if (reply.ok) {
        rec.result = reply.value;
    } else {
        rec.error = reply.error;
    }
    rec.timestamp = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        rec.sequence_number = next_sequence_++;
        call_log_.push_back(rec);
    }

    if (audit_) {
        json details = {{"tool", tool_name}, {"sequence", rec.sequence_number}};
        if (rec.error) {
            details["error_kind"] = core::error_kind_to_string(rec.error->kind);
            details["message"] = rec.error->message;
        }
        audit_->log(AuditCategory::TOOL_CALL, "TOOL_CALL", execution_id_,
                    policy_->mcp_name, details, reply.ok);
    }

    spdlog::debug("[{}] tool call #{} {} -> {}", execution_id_, rec.sequence_number, tool_name,
                  rec.error ? core::error_kind_to_string(rec.error->kind) : "ok");
}

// ============================================================================
// Filesystem capability
// ============================================================================

BridgeReply ToolBridge::read_file(const std::string& path) {
    std::string reason;
    if (!policy::CapabilityChecker::can_access_path(*policy_, path, policy::PathAccess::READ,
                                                    &reason)) {
        if (audit_) {
            audit_->log(AuditCategory::FILESYSTEM, "READ_DENIED", execution_id_,
                        policy_->mcp_name, {{"path", path}, {"reason", reason}}, false);
        }
        return BridgeReply::denied(ErrorKind::FILE_ACCESS_DENIED, reason);
    }

    std::string normalized = policy::CapabilityChecker::normalize_path(path);
    std::error_code ec;
    auto size = fs::file_size(normalized, ec);
    if (ec) {
        return BridgeReply::denied(ErrorKind::FILE_ACCESS_DENIED,
                                   fmt::format("cannot read '{}': {}", normalized, ec.message()));
    }
    if (size > MAX_FILE_BYTES) {
        return BridgeReply::denied(ErrorKind::FILE_ACCESS_DENIED,
            fmt::format("'{}' is {} bytes, limit is {}", normalized, size, MAX_FILE_BYTES));
    }

    std::ifstream ifs(normalized, std::ios::binary);
    if (!ifs.is_open()) {
        return BridgeReply::denied(ErrorKind::FILE_ACCESS_DENIED,
                                   fmt::format("cannot open '{}'", normalized));
    }
    std::ostringstream content;
    content << ifs.rdbuf();

    if (audit_) {
        audit_->log(AuditCategory::FILESYSTEM, "READ", execution_id_, policy_->mcp_name,
                    {{"path", normalized}, {"bytes", size}}, true);
    }
    return BridgeReply::success(content.str());
}

BridgeReply ToolBridge::write_file(const std::string& path, const std::string& content) {
    std::string reason;
    if (!policy::CapabilityChecker::can_access_path(*policy_, path, policy::PathAccess::WRITE,
                                                    &reason)) {
        if (audit_) {
            audit_->log(AuditCategory::FILESYSTEM, "WRITE_DENIED", execution_id_,
                        policy_->mcp_name, {{"path", path}, {"reason", reason}}, false);
        }
        return BridgeReply::denied(ErrorKind::FILE_ACCESS_DENIED, reason);
    }
    if (content.size() > MAX_FILE_BYTES) {
        return BridgeReply::denied(ErrorKind::FILE_ACCESS_DENIED,
            fmt::format("content is {} bytes, limit is {}", content.size(), MAX_FILE_BYTES));
    }

    std::string normalized = policy::CapabilityChecker::normalize_path(path);
    std::ofstream ofs(normalized, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        return BridgeReply::denied(ErrorKind::FILE_ACCESS_DENIED,
                                   fmt::format("cannot open '{}' for writing", normalized));
    }
    ofs << content;
    ofs.flush();
    if (!ofs.good()) {
        return BridgeReply::denied(ErrorKind::FILE_ACCESS_DENIED,
                                   fmt::format("short write to '{}'", normalized));
    }

    if (audit_) {
        audit_->log(AuditCategory::FILESYSTEM, "WRITE", execution_id_, policy_->mcp_name,
                    {{"path", normalized}, {"bytes", content.size()}}, true);
    }
    return BridgeReply::success(json{{"bytesWritten", content.size()}});
}

// ============================================================================
// Network capability
// ============================================================================

BridgeReply ToolBridge::fetch(const std::string& url, const json& init) {
    std::string reason;
    if (!policy::CapabilityChecker::can_fetch(*policy_, url, &reason)) {
        if (audit_) {
            audit_->log(AuditCategory::NETWORK, "FETCH_DENIED", execution_id_,
                        policy_->mcp_name, {{"url", url}, {"reason", reason}}, false);
        }
        spdlog::info("[{}] network access denied: {}", execution_id_, reason);
        return BridgeReply::denied(ErrorKind::NETWORK_DENIED, reason);
    }

    if (!fetcher_) {
        if (audit_) {
            audit_->log(AuditCategory::NETWORK, "FETCH_DENIED", execution_id_,
                        policy_->mcp_name, {{"url", url}, {"reason", "no fetcher"}}, false);
        }
        return BridgeReply::denied(ErrorKind::NETWORK_DENIED, "no outbound fetcher configured");
    }

    BridgeReply reply = fetcher_->fetch(url, init.is_object() ? init : json::object());
    if (audit_) {
        audit_->log(AuditCategory::NETWORK, "FETCH", execution_id_, policy_->mcp_name,
                    {{"url", url}}, reply.ok);
    }
    return reply;
}

// ============================================================================
// Frame dispatch
// ============================================================================

BridgeReply ToolBridge::handle_frame(const json& frame) {
    auto require_string = [&frame](const char* key) -> const json* {
        if (!frame.contains(key) || !frame[key].is_string()) {
            return nullptr;
        }
        return &frame[key];
    };

    switch (frame_op(frame)) {
        case FrameOp::CALL: {
            const json* tool = require_string("tool");
            if (!tool) {
                return BridgeReply::denied(ErrorKind::UNKNOWN_TOOL, "call frame without tool name");
            }
            return call_tool(tool->get<std::string>(),
                             frame.contains("args") ? frame["args"] : json::object());
        }
        case FrameOp::FETCH: {
            const json* url = require_string("url");
            if (!url) {
                return BridgeReply::denied(ErrorKind::NETWORK_DENIED, "fetch frame without url");
            }
            return fetch(url->get<std::string>(),
                         frame.contains("init") ? frame["init"] : json::object());
        }
        case FrameOp::READ: {
            const json* path = require_string("path");
            if (!path) {
                return BridgeReply::denied(ErrorKind::FILE_ACCESS_DENIED, "read frame without path");
            }
            return read_file(path->get<std::string>());
        }
        case FrameOp::WRITE: {
            const json* path = require_string("path");
            const json* content = require_string("content");
            if (!path || !content) {
                return BridgeReply::denied(ErrorKind::FILE_ACCESS_DENIED,
                                           "write frame needs path and content");
            }
            return write_file(path->get<std::string>(), content->get<std::string>());
        }
        default:
            return BridgeReply::denied(ErrorKind::RUNTIME_ERROR, "unsupported bridge request");
    }
}

std::vector<core::ToolCallRecord> ToolBridge::call_log() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return call_log_;
}

uint64_t ToolBridge::ledger_used() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_used_;
}

} // namespace mcpguard::bridge
