/**
 * mcpguard ToolBridge
 *
 * The only path from sandboxed code to anything outside it. One bridge
 * serves one execution: it owns that execution's call ledger and call log
 * and enforces the resolved policy on every request frame.
 *
 * Tool call order: name check (UnknownTool), ledger check
 * (CallBudgetExceeded, nothing forwarded), forward. Every attempt is
 * recorded in the call log. Only attempts that pass the name check and
 * the ledger check consume a ledger slot.
 */
#pragma once
#include <string>
#include <vector>
#include <set>
#include <memory>
#include <mutex>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "bridge/frame.hpp"
#include "bridge/tool_server.hpp"
#include "core/types.hpp"

namespace mcpguard::kernel {
class AuditLogger;
}

namespace mcpguard::bridge {

// Performs allowed outbound requests; supplied by the embedder
class OutboundFetcher {
public:
    virtual ~OutboundFetcher() = default;

    // init carries method/headers/body as passed by the script
    virtual BridgeReply fetch(const std::string& url, const nlohmann::json& init) = 0;
};

class ToolBridge {
public:
    ToolBridge(std::string execution_id,
               std::shared_ptr<const core::IsolationPolicy> policy,
               std::set<std::string> tool_names,
               std::shared_ptr<ToolServerConnection> connection,
               kernel::AuditLogger* audit = nullptr,
               std::shared_ptr<OutboundFetcher> fetcher = nullptr);

    ToolBridge(const ToolBridge&) = delete;
    ToolBridge& operator=(const ToolBridge&) = delete;

    BridgeReply call_tool(const std::string& tool_name, const nlohmann::json& arguments);
    BridgeReply read_file(const std::string& path);
    BridgeReply write_file(const std::string& path, const std::string& content);
    BridgeReply fetch(const std::string& url, const nlohmann::json& init);

    // Dispatches a call/fetch/read/write frame; malformed frames are denied
    BridgeReply handle_frame(const nlohmann::json& frame);

    std::vector<core::ToolCallRecord> call_log() const;
    uint64_t ledger_used() const;
    const core::IsolationPolicy& policy() const { return *policy_; }

    static constexpr size_t MAX_FILE_BYTES = 4 * 1024 * 1024;

private:
    void record(const std::string& tool_name, const nlohmann::json& arguments,
                const BridgeReply& reply);

    std::string execution_id_;
    std::shared_ptr<const core::IsolationPolicy> policy_;
    std::set<std::string> tool_names_;
    std::shared_ptr<ToolServerConnection> connection_;
    kernel::AuditLogger* audit_;
    std::shared_ptr<OutboundFetcher> fetcher_;

    mutable std::mutex mutex_;
    uint64_t ledger_used_ = 0;
    uint64_t next_sequence_ = 1;
    std::vector<core::ToolCallRecord> call_log_;
};

} // namespace mcpguard::bridge
