/**
 * mcpguard SandboxRunner
 *
 * Owns the lifecycle of one execution:
 *   GENERATING  artifact + manifest into a fresh scratch workspace
 *   BUILDING    build toolchain on the artifact
 *   EXECUTING   isolated runtime, bridge frames served over fd 3
 * and ends in COMPLETED or FAILED. The failing stage decides the error
 * kind; output text is only used to locate the error.
 *
 * On every path the scratch workspace is removed and the runtime's
 * process tree is killed before run() returns.
 *
 * Bridge requests are forwarded on worker threads so the deadline and
 * cancellation stay live while a tool call is outstanding. A worker can
 * outlive the run that started it; the runner's destructor waits for it.
 */
#pragma once
#include <string>
#include <vector>
#include <set>
#include <memory>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "bridge/tool_bridge.hpp"
#include "runtime/cancellation.hpp"

namespace mcpguard::config {
struct OrchestratorConfig;
}

namespace mcpguard::kernel {
class AuditLogger;
}

namespace mcpguard::runtime {

struct RunnerOptions {
    std::string scratch_root = "/tmp";
    std::vector<std::string> build_command;
    std::vector<std::string> runtime_command;
    int build_timeout_ms = 30000;
    int timeout_grace_ms = 500;
    size_t max_output_bytes = 1024 * 1024;
    bool enable_namespaces = true;
    bool enable_cgroups = true;
    std::string cgroup_root = "/sys/fs/cgroup/mcpguard";

    static RunnerOptions from_config(const config::OrchestratorConfig& config);
};

// Inputs of one run; the policy is frozen for the run's lifetime
struct RunContext {
    std::string execution_id;
    std::string script_source;
    nlohmann::json input_args = nlohmann::json::object();
    std::shared_ptr<const core::IsolationPolicy> policy;
    std::set<std::string> tool_names;
    std::shared_ptr<bridge::ToolServerConnection> connection;
    std::shared_ptr<bridge::OutboundFetcher> fetcher;
    std::shared_ptr<CancellationToken> cancel;
};

class SandboxRunner {
public:
    explicit SandboxRunner(RunnerOptions options, kernel::AuditLogger* audit = nullptr);
    ~SandboxRunner();

    SandboxRunner(const SandboxRunner&) = delete;
    SandboxRunner& operator=(const SandboxRunner&) = delete;

    core::ExecutionResult run(const RunContext& ctx);

    const RunnerOptions& options() const { return options_; }

    struct BridgeWorkers;

private:
    RunnerOptions options_;
    kernel::AuditLogger* audit_;
    std::shared_ptr<BridgeWorkers> workers_;
};

} // namespace mcpguard::runtime
