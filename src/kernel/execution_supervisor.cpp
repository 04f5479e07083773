#include "kernel/execution_supervisor.hpp"
#include "kernel/audit_log.hpp"
#include "bridge/tool_server.hpp"
#include "config/settings_store.hpp"
#include "policy/policy_resolver.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <random>
#include <thread>

namespace mcpguard::kernel {

using core::ErrorKind;
using core::ExecutionResult;

namespace {

// Starts the tool server on the first call, so a cached schema lets a
// script that calls nothing run without the server
class LazyConnection : public bridge::ToolServerConnection {
public:
    LazyConnection(bridge::ToolServerRegistry& registry, std::string mcp_name)
        : registry_(registry), mcp_name_(std::move(mcp_name)) {}

    std::optional<std::vector<core::ToolDescriptor>> list_tools(std::string* error) override {
        auto conn = connection(error);
        if (!conn) {
            return std::nullopt;
        }
        return conn->list_tools(error);
    }

    bridge::ToolCallOutcome call_tool(const std::string& name, const nlohmann::json& arguments) override {
        std::string error;
        auto conn = connection(&error);
        if (!conn) {
            bridge::ToolCallOutcome outcome;
            outcome.error = fmt::format("tool server {} unavailable: {}", mcp_name_, error);
            return outcome;
        }
        return conn->call_tool(name, arguments);
    }

    std::string name() const override { return mcp_name_; }

private:
    std::shared_ptr<bridge::ToolServerConnection> connection(std::string* error) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!conn_) {
            conn_ = registry_.connect(mcp_name_, error);
        }
        return conn_;
    }

    bridge::ToolServerRegistry& registry_;
    std::string mcp_name_;
    std::mutex mutex_;
    std::shared_ptr<bridge::ToolServerConnection> conn_;
};

} // anonymous namespace

ExecutionSupervisor::ExecutionSupervisor(runtime::RunnerOptions runner_options,
                                         size_t max_script_bytes,
                                         config::SettingsStore& settings,
                                         schema::SchemaCache& schema_cache,
                                         bridge::ToolServerRegistry& registry,
                                         AuditLogger* audit)
    : runner_(std::move(runner_options), audit),
      validator_(max_script_bytes),
      settings_(settings),
      schema_cache_(schema_cache),
      registry_(registry),
      audit_(audit) {
    schema::SchemaCache* cache = &schema_cache_;
    registry_.add_change_listener([cache](const std::string& mcp_name) {
        cache->on_server_config_changed(mcp_name);
    });
}

ExecutionSupervisor::~ExecutionSupervisor() {
    size_t cancelled = cancel_all();
    if (cancelled > 0) {
        spdlog::info("Cancelled {} in-flight execution(s) on shutdown", cancelled);
    }
    wait_idle();
}

std::string ExecutionSupervisor::generate_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    return fmt::format("exec-{:016x}", rng());
}

// ============================================================================
// Active set
// ============================================================================

std::shared_ptr<runtime::CancellationToken> ExecutionSupervisor::reserve(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_.count(id)) {
        return nullptr;
    }
    auto token = std::make_shared<runtime::CancellationToken>();
    active_[id] = token;
    return token;
}

void ExecutionSupervisor::release(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(id);
}

bool ExecutionSupervisor::cancel(const std::string& id) {
    std::shared_ptr<runtime::CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(id);
        if (it == active_.end()) {
            return false;
        }
        token = it->second;
    }
    if (token->cancel()) {
        spdlog::info("[{}] cancellation requested", id);
        if (audit_) {
            audit_->log_execution("EXECUTION_CANCEL_REQUESTED", id, "", {});
        }
    }
    return true;
}

size_t ExecutionSupervisor::cancel_all() {
    std::vector<std::shared_ptr<runtime::CancellationToken>> tokens;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, token] : active_) {
            tokens.push_back(token);
        }
    }
    size_t count = 0;
    for (auto& token : tokens) {
        if (token->cancel()) count++;
    }
    return count;
}

std::vector<std::string> ExecutionSupervisor::active_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, token] : active_) {
        ids.push_back(id);
    }
    return ids;
}

// ============================================================================
// Submission
// ============================================================================

ExecutionResult ExecutionSupervisor::submit(core::ExecutionRequest request) {
    if (request.id.empty()) {
        request.id = generate_id();
    }
    auto token = reserve(request.id);
    if (!token) {
        spdlog::warn("[{}] rejected: execution with this id is already in flight", request.id);
        if (audit_) {
            audit_->log_execution("DUPLICATE_EXECUTION", request.id, request.target_server, {}, false);
        }
        return ExecutionResult::rejected(request.id, ErrorKind::DUPLICATE_EXECUTION,
            fmt::format("execution '{}' is already in flight", request.id));
    }

    ExecutionResult result;
    try {
        result = execute_reserved(request, token);
    } catch (const std::exception& e) {
        spdlog::error("[{}] execution aborted: {}", request.id, e.what());
        result = ExecutionResult::rejected(request.id, ErrorKind::RUNTIME_ERROR,
                                           fmt::format("internal error: {}", e.what()));
    }
    release(request.id);
    return result;
}

void ExecutionSupervisor::submit_with_callback(core::ExecutionRequest request,
                                               ResultCallback callback) {
    if (request.id.empty()) {
        request.id = generate_id();
    }
    auto token = reserve(request.id);
    if (!token) {
        spdlog::warn("[{}] rejected: execution with this id is already in flight", request.id);
        callback(ExecutionResult::rejected(request.id, ErrorKind::DUPLICATE_EXECUTION,
            fmt::format("execution '{}' is already in flight", request.id)));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        inflight_++;
    }

    std::thread([this, request = std::move(request), token, callback = std::move(callback)]() {
        ExecutionResult result;
        try {
            result = execute_reserved(request, token);
        } catch (const std::exception& e) {
            spdlog::error("[{}] execution aborted: {}", request.id, e.what());
            result = ExecutionResult::rejected(request.id, ErrorKind::RUNTIME_ERROR,
                                               fmt::format("internal error: {}", e.what()));
        }
        release(request.id);
        try {
            callback(std::move(result));
        } catch (const std::exception& e) {
            spdlog::error("[{}] result delivery failed: {}", request.id, e.what());
        }

        std::lock_guard<std::mutex> lock(inflight_mutex_);
        inflight_--;
        inflight_cv_.notify_all();
    }).detach();
}

std::future<ExecutionResult> ExecutionSupervisor::submit_async(core::ExecutionRequest request) {
    auto promise = std::make_shared<std::promise<ExecutionResult>>();
    auto future = promise->get_future();
    submit_with_callback(std::move(request), [promise](ExecutionResult result) {
        promise->set_value(std::move(result));
    });
    return future;
}

void ExecutionSupervisor::wait_idle() {
    std::unique_lock<std::mutex> lock(inflight_mutex_);
    inflight_cv_.wait(lock, [this] { return inflight_ == 0; });
}

// ============================================================================
// Pre-flight and run
// ============================================================================

ExecutionResult ExecutionSupervisor::execute_reserved(const core::ExecutionRequest& request,
                                                      std::shared_ptr<runtime::CancellationToken> cancel) {
    const std::string& id = request.id;
    spdlog::info("[{}] submitted for {}", id, request.target_server);

    // Validation
    policy::ValidationResult validation = validator_.validate(request.script_source);
    if (!validation.ok) {
        spdlog::info("[{}] rejected by validator: {}", id, validation.message);
        if (audit_) {
            audit_->log_security("POLICY_VIOLATION", id, request.target_server,
                                 {{"pattern", validation.pattern},
                                  {"line", validation.line},
                                  {"message", validation.message}});
        }
        ExecutionResult result = ExecutionResult::rejected(id, ErrorKind::POLICY_VIOLATION,
                                                           validation.message);
        if (validation.line > 0) {
            result.error->file = "script";
            result.error->line = validation.line;
            result.error->column = validation.column;
        }
        return result;
    }

    // Policy
    core::IsolationPolicy policy;
    if (request.policy) {
        policy = *request.policy;
        if (policy.mcp_name.empty()) {
            policy.mcp_name = request.target_server;
        }
    } else {
        policy = policy::PolicyResolver(settings_).resolve(request.target_server);
    }

    // Schema
    std::string schema_error;
    auto entry = resolve_schema(request.target_server, &schema_error);
    if (!entry) {
        spdlog::warn("[{}] tool server {} unavailable: {}", id, request.target_server, schema_error);
        return ExecutionResult::rejected(id, ErrorKind::TOOL_SERVER_UNAVAILABLE, schema_error);
    }

    std::shared_ptr<bridge::OutboundFetcher> fetcher;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fetcher = fetcher_;
    }

    runtime::RunContext ctx;
    ctx.execution_id = id;
    ctx.script_source = request.script_source;
    ctx.input_args = request.input_args.is_null() ? nlohmann::json::object() : request.input_args;
    ctx.policy = std::make_shared<const core::IsolationPolicy>(std::move(policy));
    ctx.tool_names = entry->tool_names;
    ctx.connection = std::make_shared<LazyConnection>(registry_, request.target_server);
    ctx.fetcher = fetcher;
    ctx.cancel = std::move(cancel);

    if (audit_) {
        audit_->log_execution("EXECUTION_STARTED", id, request.target_server,
                              {{"tools", entry->tool_names.size()},
                               {"max_tool_calls", ctx.policy->limits.max_tool_calls},
                               {"cpu_ms", ctx.policy->limits.cpu_ms}});
    }
    return runner_.run(ctx);
}

std::optional<schema::SchemaCacheEntry> ExecutionSupervisor::resolve_schema(
    const std::string& mcp_name, std::string* error) {

    auto hash = registry_.config_hash(mcp_name);
    if (!hash) {
        if (error) *error = fmt::format("unknown tool server '{}'", mcp_name);
        return std::nullopt;
    }

    if (auto cached = schema_cache_.get(mcp_name, *hash)) {
        spdlog::debug("Schema cache hit for {} ({})", mcp_name, *hash);
        if (audit_) {
            audit_->log(AuditCategory::SCHEMA_CACHE, "SCHEMA_HIT", "", mcp_name,
                        {{"config_hash", *hash}});
        }
        return cached;
    }

    spdlog::debug("Schema cache miss for {} ({}), listing tools", mcp_name, *hash);
    if (audit_) {
        audit_->log(AuditCategory::SCHEMA_CACHE, "SCHEMA_MISS", "", mcp_name,
                    {{"config_hash", *hash}});
    }
    auto conn = registry_.connect(mcp_name, error);
    if (!conn) {
        return std::nullopt;
    }
    auto tools = conn->list_tools(error);
    if (!tools) {
        return std::nullopt;
    }

    auto entry = schema::SchemaCacheEntry::make(mcp_name, *hash, std::move(*tools));
    if (!schema_cache_.put(entry)) {
        spdlog::warn("Schema for {} cached in memory only; persisting failed", mcp_name);
    }
    return entry;
}

size_t ExecutionSupervisor::invalidate_schema(const std::string& mcp_name) {
    size_t removed = schema_cache_.invalidate(mcp_name);
    spdlog::info("Invalidated {} schema cache entr{} for {}", removed,
                 removed == 1 ? "y" : "ies", mcp_name);
    return removed;
}

std::optional<schema::SchemaCacheEntry> ExecutionSupervisor::get_cached_schema(
    const std::string& mcp_name, const std::string& config_hash) const {
    return schema_cache_.get(mcp_name, config_hash);
}

void ExecutionSupervisor::set_outbound_fetcher(std::shared_ptr<bridge::OutboundFetcher> fetcher) {
    std::lock_guard<std::mutex> lock(mutex_);
    fetcher_ = std::move(fetcher);
}

} // namespace mcpguard::kernel
