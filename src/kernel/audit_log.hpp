/**
 * mcpguard Audit Log
 *
 * Bounded in-memory record of security decisions, execution lifecycle,
 * tool calls and capability use. Categories can be toggled; entries export
 * as JSONL.
 */
#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <chrono>
#include <optional>
#include <set>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace mcpguard::kernel {

enum class AuditCategory {
    SECURITY,       // Policy violations, capability denials, degraded isolation
    EXECUTION,      // Submitted, phase transitions, finished, cancelled
    TOOL_CALL,      // Every tool bridge call attempt
    SCHEMA_CACHE,   // Hits, misses, invalidations
    NETWORK,        // Outbound fetch decisions
    FILESYSTEM      // File read/write decisions
};

inline std::string audit_category_to_string(AuditCategory cat) {
    switch (cat) {
        case AuditCategory::SECURITY:     return "SECURITY";
        case AuditCategory::EXECUTION:    return "EXECUTION";
        case AuditCategory::TOOL_CALL:    return "TOOL_CALL";
        case AuditCategory::SCHEMA_CACHE: return "SCHEMA_CACHE";
        case AuditCategory::NETWORK:      return "NETWORK";
        case AuditCategory::FILESYSTEM:   return "FILESYSTEM";
        default: return "UNKNOWN";
    }
}

inline std::optional<AuditCategory> audit_category_from_string(const std::string& str) {
    if (str == "SECURITY")     return AuditCategory::SECURITY;
    if (str == "EXECUTION")    return AuditCategory::EXECUTION;
    if (str == "TOOL_CALL")    return AuditCategory::TOOL_CALL;
    if (str == "SCHEMA_CACHE") return AuditCategory::SCHEMA_CACHE;
    if (str == "NETWORK")      return AuditCategory::NETWORK;
    if (str == "FILESYSTEM")   return AuditCategory::FILESYSTEM;
    return std::nullopt;
}

struct AuditLogEntry {
    uint64_t id;
    std::chrono::system_clock::time_point timestamp;
    AuditCategory category;
    std::string event_type;                   // e.g. "POLICY_VIOLATION", "TOOL_CALL"
    std::string execution_id;                 // empty for orchestrator-level events
    std::string mcp_name;
    nlohmann::json details;
    bool success;

    nlohmann::json to_json() const;
    std::string to_jsonl() const;
};

struct AuditConfig {
    size_t max_entries = 10000;
    std::set<AuditCategory> muted;      // categories dropped on log()

    bool is_enabled(AuditCategory cat) const { return muted.count(cat) == 0; }
};

// Selects entries for get_entries(); unset fields match everything
struct AuditQuery {
    std::optional<AuditCategory> category;
    std::string execution_id;
    uint64_t since_id = 0;

    bool matches(const AuditLogEntry& entry) const;
};

class AuditLogger {
public:
    explicit AuditLogger(AuditConfig config = {});

    void log(AuditCategory category,
             const std::string& event_type,
             const std::string& execution_id,
             const std::string& mcp_name,
             const nlohmann::json& details,
             bool success = true);

    void log_security(const std::string& event_type, const std::string& execution_id,
                      const std::string& mcp_name, const nlohmann::json& details);
    void log_execution(const std::string& event_type, const std::string& execution_id,
                       const std::string& mcp_name, const nlohmann::json& details,
                       bool success = true);

    // The newest `limit` matches, oldest first
    std::vector<AuditLogEntry> query(const AuditQuery& q, size_t limit = 100) const;

    std::vector<AuditLogEntry> get_entries(
        const std::optional<AuditCategory>& category = std::nullopt,
        const std::string& execution_id = "",    // empty = all
        uint64_t since_id = 0,
        size_t limit = 100
    ) const {
        return query(AuditQuery{category, execution_id, since_id}, limit);
    }

    std::string export_jsonl(size_t limit = 0) const;  // 0 = all entries

    void clear();

    size_t entry_count() const;
    uint64_t last_entry_id() const;

private:
    const AuditConfig config_;
    std::deque<AuditLogEntry> entries_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
};

} // namespace mcpguard::kernel
