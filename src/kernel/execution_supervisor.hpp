/**
 * mcpguard ExecutionSupervisor
 *
 * Public entry point for executions. Tracks in-flight request ids so they
 * can be cancelled, rejects a second request with an in-flight id, and runs
 * pre-flight in this order:
 *   duplicate check -> validation -> policy -> schema -> SandboxRunner
 * Distinct ids run concurrently. Nothing thrown below escapes submit().
 */
#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <optional>
#include "core/types.hpp"
#include "policy/script_validator.hpp"
#include "runtime/sandbox_runner.hpp"
#include "schema/schema_cache.hpp"

namespace mcpguard::config {
class SettingsStore;
}

namespace mcpguard::bridge {
class ToolServerRegistry;
class OutboundFetcher;
}

namespace mcpguard::kernel {

class AuditLogger;

using ResultCallback = std::function<void(core::ExecutionResult)>;

class ExecutionSupervisor {
public:
    ExecutionSupervisor(runtime::RunnerOptions runner_options,
                        size_t max_script_bytes,
                        config::SettingsStore& settings,
                        schema::SchemaCache& schema_cache,
                        bridge::ToolServerRegistry& registry,
                        AuditLogger* audit = nullptr);

    // Cancels what is still running and waits for it
    ~ExecutionSupervisor();

    ExecutionSupervisor(const ExecutionSupervisor&) = delete;
    ExecutionSupervisor& operator=(const ExecutionSupervisor&) = delete;

    // Blocking. An empty id gets a generated one.
    core::ExecutionResult submit(core::ExecutionRequest request);

    // Duplicate ids are rejected before this returns; the future is then
    // already ready
    std::future<core::ExecutionResult> submit_async(core::ExecutionRequest request);

    // Runs on a worker thread; the callback is invoked exactly once, from
    // that thread or (for a duplicate) from the caller's
    void submit_with_callback(core::ExecutionRequest request, ResultCallback callback);

    // False if no execution with that id is in flight
    bool cancel(const std::string& id);
    size_t cancel_all();

    std::vector<std::string> active_ids() const;

    size_t invalidate_schema(const std::string& mcp_name);
    std::optional<schema::SchemaCacheEntry> get_cached_schema(const std::string& mcp_name,
                                                              const std::string& config_hash) const;

    void set_outbound_fetcher(std::shared_ptr<bridge::OutboundFetcher> fetcher);

    // Blocks until no async execution is running
    void wait_idle();

    static std::string generate_id();

private:
    std::shared_ptr<runtime::CancellationToken> reserve(const std::string& id);
    void release(const std::string& id);

    // Everything after the duplicate check
    core::ExecutionResult execute_reserved(const core::ExecutionRequest& request,
                                           std::shared_ptr<runtime::CancellationToken> cancel);

    std::optional<schema::SchemaCacheEntry> resolve_schema(const std::string& mcp_name,
                                                           std::string* error);

    runtime::SandboxRunner runner_;
    policy::ScriptValidator validator_;
    config::SettingsStore& settings_;
    schema::SchemaCache& schema_cache_;
    bridge::ToolServerRegistry& registry_;
    AuditLogger* audit_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<runtime::CancellationToken>> active_;
    std::shared_ptr<bridge::OutboundFetcher> fetcher_;

    std::mutex inflight_mutex_;
    std::condition_variable inflight_cv_;
    size_t inflight_ = 0;
};

} // namespace mcpguard::kernel
