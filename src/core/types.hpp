/**
 * mcpguard core types
 *
 * Data model shared by every component: the resolved isolation policy,
 * execution requests and results, tool descriptors and call records.
 */
#pragma once
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace mcpguard::core {

using json = nlohmann::json;

// ============================================================================
// Phases and error kinds
// ============================================================================

// Phases advance strictly in declaration order; FAILED is reachable from any
enum class ExecutionPhase {
    GENERATING,
    BUILDING,
    EXECUTING,
    COMPLETED,
    FAILED
};

enum class ErrorKind {
    POLICY_VIOLATION,
    GENERATION_ERROR,
    BUILD_ERROR,
    RUNTIME_ERROR,
    TIMEOUT_ERROR,
    UNKNOWN_TOOL,
    CALL_BUDGET_EXCEEDED,
    DUPLICATE_EXECUTION,
    CANCELLED,
    TOOL_SERVER_UNAVAILABLE,
    TOOL_ERROR,
    NETWORK_DENIED,
    FILE_ACCESS_DENIED
};

const char* phase_to_string(ExecutionPhase phase);
std::optional<ExecutionPhase> phase_from_string(const std::string& str);

const char* error_kind_to_string(ErrorKind kind);
std::optional<ErrorKind> error_kind_from_string(const std::string& str);

// ISO 8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z
std::string format_timestamp(std::chrono::system_clock::time_point tp);

// For documents carrying bytes from outside (script output, file contents):
// invalid UTF-8 is written as U+FFFD instead of throwing
std::string dump_json(const json& j, int indent = -1);
std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& str);

// ============================================================================
// Isolation policy
// ============================================================================

struct NetworkPolicy {
    // nullopt is the only deny-all representation; never an empty set
    std::optional<std::set<std::string>> allowed_hosts;
    bool allow_localhost = false;
};

struct FileSystemPolicy {
    bool enabled = false;
    std::vector<std::string> read_paths;
    std::vector<std::string> write_paths;
};

struct PolicyLimits {
    int64_t cpu_ms = 30000;
    int64_t memory_mb = 128;
    int64_t max_tool_calls = 100;
};

struct IsolationPolicy {
    std::string mcp_name;
    bool isolation_enabled = true;
    NetworkPolicy network;
    FileSystemPolicy file_system;
    PolicyLimits limits;

    json to_json() const;
    static std::optional<IsolationPolicy> from_json(const json& j, std::string* error = nullptr);
};

// ============================================================================
// Tools
// ============================================================================

struct ToolDescriptor {
    std::string name;
    std::optional<std::string> description;
    json input_schema = json::object();

    json to_json() const;
    static std::optional<ToolDescriptor> from_json(const json& j);

    bool operator==(const ToolDescriptor& other) const {
        return name == other.name && description == other.description &&
               input_schema == other.input_schema;
    }
};

// ============================================================================
// Errors and results
// ============================================================================

struct ExecutionError {
    ErrorKind kind = ErrorKind::RUNTIME_ERROR;
    std::optional<std::string> file;
    std::optional<int> line;
    std::optional<int> column;
    std::string message;
    std::optional<std::string> stack;

    json to_json() const;
    static std::optional<ExecutionError> from_json(const json& j);

    static ExecutionError make(ErrorKind kind, std::string message) {
        ExecutionError err;
        err.kind = kind;
        err.message = std::move(message);
        return err;
    }
};

struct ToolCallRecord {
    uint64_t sequence_number = 0;
    std::string tool_name;
    json arguments = json::object();
    bool success = false;
    json result;                          // set when success
    std::optional<ExecutionError> error;  // set when !success
    std::chrono::system_clock::time_point timestamp;

    json to_json() const;
};

// What the OS isolation layer actually applied to a run
struct IsolationStatus {
    bool requested = true;
    bool user_namespace = false;
    bool pid_namespace = false;
    bool net_namespace = false;
    bool cgroup_assigned = false;
    bool memory_limit_applied = false;
    bool pids_limit_applied = false;
    bool rlimits_applied = false;

    bool fully_isolated = false;
    std::string degraded_reason;

    bool is_degraded() const { return requested && !fully_isolated; }
    json to_json() const;
};

struct ExecutionRequest {
    std::string id;
    std::string script_source;
    std::string target_server;
    std::optional<IsolationPolicy> policy;
    json input_args = json::object();

    json to_json() const;
    static std::optional<ExecutionRequest> from_json(const json& j, std::string* error = nullptr);
};

struct ExecutionResult {
    std::string id;
    ExecutionPhase final_phase = ExecutionPhase::FAILED;
    std::optional<ExecutionPhase> failed_phase;
    std::vector<ExecutionPhase> phase_trace;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    json result;
    std::optional<ExecutionError> error;
    std::vector<ToolCallRecord> tool_call_log;
    uint64_t duration_ms = 0;
    IsolationStatus isolation;

    bool succeeded() const { return final_phase == ExecutionPhase::COMPLETED; }

    json to_json() const;

    // Pre-flight rejection: no phase was entered, failed_phase stays empty
    static ExecutionResult rejected(const std::string& id, ErrorKind kind, std::string message);
};

} // namespace mcpguard::core
