#include "core/types.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcpguard::core {

namespace {

struct PhaseName {
    ExecutionPhase phase;
    const char* name;
};

constexpr PhaseName PHASE_NAMES[] = {
    {ExecutionPhase::GENERATING, "Generating"},
    {ExecutionPhase::BUILDING, "Building"},
    {ExecutionPhase::EXECUTING, "Executing"},
    {ExecutionPhase::COMPLETED, "Completed"},
    {ExecutionPhase::FAILED, "Failed"},
};

struct KindName {
    ErrorKind kind;
    const char* name;
};

constexpr KindName KIND_NAMES[] = {
    {ErrorKind::POLICY_VIOLATION, "PolicyViolation"},
    {ErrorKind::GENERATION_ERROR, "GenerationError"},
    {ErrorKind::BUILD_ERROR, "BuildError"},
    {ErrorKind::RUNTIME_ERROR, "RuntimeError"},
    {ErrorKind::TIMEOUT_ERROR, "TimeoutError"},
    {ErrorKind::UNKNOWN_TOOL, "UnknownTool"},
    {ErrorKind::CALL_BUDGET_EXCEEDED, "CallBudgetExceeded"},
    {ErrorKind::DUPLICATE_EXECUTION, "DuplicateExecution"},
    {ErrorKind::CANCELLED, "Cancelled"},
    {ErrorKind::TOOL_SERVER_UNAVAILABLE, "ToolServerUnavailable"},
    {ErrorKind::TOOL_ERROR, "ToolError"},
    {ErrorKind::NETWORK_DENIED, "NetworkDenied"},
    {ErrorKind::FILE_ACCESS_DENIED, "FileAccessDenied"},
};

std::vector<std::string> string_array(const json& j, const char* key) {
    std::vector<std::string> out;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            if (item.is_string()) {
                out.push_back(item.get<std::string>());
            }
        }
    }
    return out;
}

bool read_positive(const json& obj, const char* key, int64_t& out, std::string* error) {
    if (!obj.contains(key)) {
        return true;
    }
    const auto& v = obj[key];
    if (!v.is_number() || v.get<double>() <= 0) {
        if (error) *error = std::string("limits.") + key + " must be a positive number";
        return false;
    }
    out = v.get<int64_t>();
    return true;
}

} // anonymous namespace

// ============================================================================
// Enum conversions
// ============================================================================

const char* phase_to_string(ExecutionPhase phase) {
    for (const auto& entry : PHASE_NAMES) {
        if (entry.phase == phase) return entry.name;
    }
    return "Unknown";
}

std::optional<ExecutionPhase> phase_from_string(const std::string& str) {
    for (const auto& entry : PHASE_NAMES) {
        if (str == entry.name) return entry.phase;
    }
    return std::nullopt;
}

const char* error_kind_to_string(ErrorKind kind) {
    for (const auto& entry : KIND_NAMES) {
        if (entry.kind == kind) return entry.name;
    }
    return "Unknown";
}

std::optional<ErrorKind> error_kind_from_string(const std::string& str) {
    for (const auto& entry : KIND_NAMES) {
        if (str == entry.name) return entry.kind;
    }
    return std::nullopt;
}

std::string dump_json(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& str) {
    std::tm tm{};
    std::istringstream iss(str);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    int millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (std::isdigit(static_cast<unsigned char>(iss.peek()))) {
            digits.push_back(static_cast<char>(iss.get()));
        }
        // Keep millisecond precision only
        digits.resize(3, '0');
        millis = std::stoi(digits);
    }

    time_t secs = timegm(&tm);
    if (secs == static_cast<time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(secs) + std::chrono::milliseconds(millis);
}

// ============================================================================
// IsolationPolicy
// ============================================================================

json IsolationPolicy::to_json() const {
    json j;
    j["mcpName"] = mcp_name;
    j["isolationEnabled"] = isolation_enabled;

    json net;
    if (network.allowed_hosts) {
        net["allowedHosts"] = json::array();
        for (const auto& host : *network.allowed_hosts) {
            net["allowedHosts"].push_back(host);
        }
    } else {
        net["allowedHosts"] = nullptr;
    }
    net["allowLocalhost"] = network.allow_localhost;
    j["network"] = net;

    j["fileSystem"] = {
        {"enabled", file_system.enabled},
        {"readPaths", file_system.read_paths},
        {"writePaths", file_system.write_paths}
    };
    j["limits"] = {
        {"cpuMs", limits.cpu_ms},
        {"memoryMB", limits.memory_mb},
        {"maxToolCalls", limits.max_tool_calls}
    };
    return j;
}

std::optional<IsolationPolicy> IsolationPolicy::from_json(const json& j, std::string* error) {
    if (!j.is_object()) {
        if (error) *error = "policy must be a JSON object";
        return std::nullopt;
    }

    IsolationPolicy policy;
    policy.mcp_name = j.value("mcpName", "");
    policy.isolation_enabled = j.value("isolationEnabled", true);

    if (j.contains("network") && j["network"].is_object()) {
        const auto& net = j["network"];
        auto hosts = string_array(net, "allowedHosts");
        if (!hosts.empty()) {
            policy.network.allowed_hosts = std::set<std::string>(hosts.begin(), hosts.end());
        }
        policy.network.allow_localhost = net.value("allowLocalhost", false);
    }

    if (j.contains("fileSystem") && j["fileSystem"].is_object()) {
        const auto& fsj = j["fileSystem"];
        policy.file_system.enabled = fsj.value("enabled", false);
        policy.file_system.read_paths = string_array(fsj, "readPaths");
        policy.file_system.write_paths = string_array(fsj, "writePaths");
    }

    if (j.contains("limits") && j["limits"].is_object()) {
        const auto& lim = j["limits"];
        if (!read_positive(lim, "cpuMs", policy.limits.cpu_ms, error) ||
            !read_positive(lim, "memoryMB", policy.limits.memory_mb, error) ||
            !read_positive(lim, "maxToolCalls", policy.limits.max_tool_calls, error)) {
            return std::nullopt;
        }
    }

    return policy;
}

// ============================================================================
// ToolDescriptor
// ============================================================================

json ToolDescriptor::to_json() const {
    json j;
    j["name"] = name;
    if (description) {
        j["description"] = *description;
    }
    j["inputSchema"] = input_schema;
    return j;
}

std::optional<ToolDescriptor> ToolDescriptor::from_json(const json& j) {
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        return std::nullopt;
    }
    ToolDescriptor tool;
    tool.name = j["name"].get<std::string>();
    if (tool.name.empty()) {
        return std::nullopt;
    }
    if (j.contains("description") && j["description"].is_string()) {
        tool.description = j["description"].get<std::string>();
    }
    if (j.contains("inputSchema") && j["inputSchema"].is_object()) {
        tool.input_schema = j["inputSchema"];
    }
    return tool;
}

// ============================================================================
// ExecutionError / ToolCallRecord / IsolationStatus
// ============================================================================

json ExecutionError::to_json() const {
    json j;
    j["kind"] = error_kind_to_string(kind);
    j["message"] = message;
    if (file) j["file"] = *file;
    if (line) j["line"] = *line;
    if (column) j["column"] = *column;
    if (stack) j["stack"] = *stack;
    return j;
}

std::optional<ExecutionError> ExecutionError::from_json(const json& j) {
    if (!j.is_object() || !j.contains("kind") || !j["kind"].is_string()) {
        return std::nullopt;
    }
    auto kind = error_kind_from_string(j["kind"].get<std::string>());
    if (!kind) {
        return std::nullopt;
    }
    ExecutionError err;
    err.kind = *kind;
    err.message = j.value("message", "");
    if (j.contains("file") && j["file"].is_string()) err.file = j["file"].get<std::string>();
    if (j.contains("line") && j["line"].is_number_integer()) err.line = j["line"].get<int>();
    if (j.contains("column") && j["column"].is_number_integer()) err.column = j["column"].get<int>();
    if (j.contains("stack") && j["stack"].is_string()) err.stack = j["stack"].get<std::string>();
    return err;
}

json ToolCallRecord::to_json() const {
    json j;
    j["sequenceNumber"] = sequence_number;
    j["toolName"] = tool_name;
    j["arguments"] = arguments;
    j["timestamp"] = format_timestamp(timestamp);
    if (success) {
        j["outcome"] = {{"result", result}};
    } else if (error) {
        j["outcome"] = {{"error", error->to_json()}};
    }
    return j;
}

json IsolationStatus::to_json() const {
    return {
        {"requested", requested},
        {"userNamespace", user_namespace},
        {"pidNamespace", pid_namespace},
        {"netNamespace", net_namespace},
        {"cgroupAssigned", cgroup_assigned},
        {"memoryLimitApplied", memory_limit_applied},
        {"pidsLimitApplied", pids_limit_applied},
        {"rlimitsApplied", rlimits_applied},
        {"fullyIsolated", fully_isolated},
        {"degradedReason", degraded_reason}
    };
}

// ============================================================================
// ExecutionRequest / ExecutionResult
// ============================================================================

json ExecutionRequest::to_json() const {
    json j;
    j["id"] = id;
    j["scriptSource"] = script_source;
    j["targetServer"] = target_server;
    j["inputArgs"] = input_args;
    if (policy) {
        j["policy"] = policy->to_json();
    }
    return j;
}

std::optional<ExecutionRequest> ExecutionRequest::from_json(const json& j, std::string* error) {
    if (!j.is_object()) {
        if (error) *error = "request must be a JSON object";
        return std::nullopt;
    }
    if (!j.contains("scriptSource") || !j["scriptSource"].is_string()) {
        if (error) *error = "scriptSource is required";
        return std::nullopt;
    }
    if (!j.contains("targetServer") || !j["targetServer"].is_string()) {
        if (error) *error = "targetServer is required";
        return std::nullopt;
    }

    ExecutionRequest req;
    req.id = j.value("id", "");
    req.script_source = j["scriptSource"].get<std::string>();
    req.target_server = j["targetServer"].get<std::string>();
    if (j.contains("inputArgs") && !j["inputArgs"].is_null()) {
        req.input_args = j["inputArgs"];
    }
    if (j.contains("policy") && !j["policy"].is_null()) {
        auto policy = IsolationPolicy::from_json(j["policy"], error);
        if (!policy) {
            return std::nullopt;
        }
        req.policy = std::move(*policy);
    }
    return req;
}

json ExecutionResult::to_json() const {
    json j;
    j["id"] = id;
    j["finalPhase"] = phase_to_string(final_phase);
    if (failed_phase) {
        j["failedPhase"] = phase_to_string(*failed_phase);
    }
    j["phaseTrace"] = json::array();
    for (auto phase : phase_trace) {
        j["phaseTrace"].push_back(phase_to_string(phase));
    }
    j["stdout"] = stdout_text;
    j["stderr"] = stderr_text;
    j["stdoutTruncated"] = stdout_truncated;
    j["stderrTruncated"] = stderr_truncated;
    j["result"] = result;
    if (error) {
        j["error"] = error->to_json();
    }
    j["toolCallLog"] = json::array();
    for (const auto& record : tool_call_log) {
        j["toolCallLog"].push_back(record.to_json());
    }
    j["durationMs"] = duration_ms;
    j["isolation"] = isolation.to_json();
    return j;
}

ExecutionResult ExecutionResult::rejected(const std::string& id, ErrorKind kind,
                                          std::string message) {
    ExecutionResult result;
    result.id = id;
    result.final_phase = ExecutionPhase::FAILED;
    result.phase_trace.push_back(ExecutionPhase::FAILED);
    result.error = ExecutionError::make(kind, std::move(message));
    result.isolation.requested = false;
    return result;
}

} // namespace mcpguard::core
