#include "test_framework.hpp"
#include "helpers/test_helpers.hpp"
#include "bridge/tool_server.hpp"
#include "config/settings_store.hpp"
#include "kernel/audit_log.hpp"
#include "kernel/execution_supervisor.hpp"
#include "schema/schema_cache.hpp"
#include <algorithm>
#include <future>

using json = nlohmann::json;
using mcpguard::core::ErrorKind;
using mcpguard::core::ExecutionRequest;
using mcpguard::kernel::ExecutionSupervisor;

namespace {

namespace fs = std::filesystem;

// Runtime stand-in: scripts containing SLOW sleep until killed, everything
// else reports the value 1
const char* RUNTIME_SCRIPT =
    "if grep -q SLOW \"$1\"; then sleep 30; fi\n"
    "printf '{\"op\":\"result\",\"value\":1}\\n' >&3\n";

// Declaration order is destruction order in reverse: the supervisor goes
// first, then the registry, then the cache and settings it writes to
struct Harness {
    mcpguard::tests::TempDir dir;
    std::unique_ptr<mcpguard::config::SettingsStore> settings;
    std::unique_ptr<mcpguard::schema::SchemaCache> cache;
    mcpguard::bridge::ToolServerRegistry registry;
    mcpguard::kernel::AuditLogger audit;
    std::shared_ptr<mcpguard::tests::FakeConnection> conn;
    std::unique_ptr<ExecutionSupervisor> supervisor;

    Harness() {
        settings = mcpguard::config::SettingsStore::in_memory();
        cache = std::make_unique<mcpguard::schema::SchemaCache>(*settings);

        mcpguard::tests::write_text(dir / "build.sh", "exit 0\n");
        mcpguard::tests::write_text(dir / "run.sh", RUNTIME_SCRIPT);
        fs::create_directories(dir / "scratch");

        mcpguard::runtime::RunnerOptions opts;
        opts.scratch_root = (dir / "scratch").string();
        opts.build_command = {"/bin/sh", (dir / "build.sh").string(), "{artifact}"};
        opts.runtime_command = {"/bin/sh", (dir / "run.sh").string(), "{artifact}"};
        opts.timeout_grace_ms = 100;
        opts.enable_namespaces = false;
        opts.enable_cgroups = false;

        conn = std::make_shared<mcpguard::tests::FakeConnection>(
            std::vector<std::string>{"search", "create_issue"});
        registry.register_connection("fake", conn, "hash-1");

        supervisor = std::make_unique<ExecutionSupervisor>(opts, 50000, *settings, *cache,
                                                           registry, &audit);
    }

    ~Harness() { supervisor.reset(); }
};

ExecutionRequest make_request(const std::string& id, const std::string& source = "return 1;") {
    ExecutionRequest request;
    request.id = id;
    request.script_source = source;
    request.target_server = "fake";
    return request;
}

bool is_active(const ExecutionSupervisor& supervisor, const std::string& id) {
    auto ids = supervisor.active_ids();
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // anonymous namespace

void register_supervisor_tests(std::vector<mcpguard::tests::TestCase>& tests) {
    using mcpguard::tests::require;
    using mcpguard::tests::wait_until;

    tests.push_back({"supervisor_runs_request", [] {
        Harness h;
        auto result = h.supervisor->submit(make_request("s1"));
        require(result.succeeded(), "completed: " + (result.error ? result.error->message : ""));
        require(result.id == "s1", "id echoed");
        require(result.result == 1, "result value");
        require(h.supervisor->active_ids().empty(), "released after completion");
    }});

    tests.push_back({"supervisor_generates_missing_id", [] {
        Harness h;
        auto result = h.supervisor->submit(make_request(""));
        require(result.id.rfind("exec-", 0) == 0, "generated id: " + result.id);
        require(ExecutionSupervisor::generate_id() != ExecutionSupervisor::generate_id(), "unique ids");
    }});

    tests.push_back({"supervisor_rejects_policy_violation_before_running", [] {
        Harness h;
        auto result = h.supervisor->submit(make_request("v1", "const x = 1;\nconst fs = require('fs');"));
        require(result.error && result.error->kind == ErrorKind::POLICY_VIOLATION, "PolicyViolation");
        require(!result.failed_phase.has_value(), "no phase entered");
        require(result.error->line == 2, "offending line reported");
        require(h.conn->list_count() == 0, "schema never fetched");

        auto security = h.audit.get_entries(mcpguard::kernel::AuditCategory::SECURITY, "v1");
        require(security.size() == 1 && security[0].event_type == "POLICY_VIOLATION", "audited");
    }});

    tests.push_back({"supervisor_unknown_or_unavailable_server", [] {
        Harness h;
        auto request = make_request("u1");
        request.target_server = "missing";
        auto unknown = h.supervisor->submit(request);
        require(unknown.error && unknown.error->kind == ErrorKind::TOOL_SERVER_UNAVAILABLE,
                "unconfigured server");

        h.conn->unavailable = true;
        auto down = h.supervisor->submit(make_request("u2"));
        require(down.error && down.error->kind == ErrorKind::TOOL_SERVER_UNAVAILABLE, "listing failed");
        require(!h.cache->get("fake", "hash-1").has_value(), "failure not cached");
    }});

    tests.push_back({"supervisor_schema_cached_per_config_hash", [] {
        Harness h;
        require(h.supervisor->submit(make_request("c1")).succeeded(), "first run");
        require(h.conn->list_count() == 1, "miss lists tools");
        require(h.supervisor->submit(make_request("c2")).succeeded(), "second run");
        require(h.conn->list_count() == 1, "hit skips listing");

        auto cached = h.supervisor->get_cached_schema("fake", "hash-1");
        require(cached.has_value(), "entry visible");
        require(cached->tool_names.count("create_issue") == 1, "tool names cached");

        auto events = h.audit.get_entries(mcpguard::kernel::AuditCategory::SCHEMA_CACHE);
        require(events.size() == 2, "hit and miss audited");
        require(events[0].event_type == "SCHEMA_MISS" && events[1].event_type == "SCHEMA_HIT",
                "miss then hit");

        h.registry.register_connection("fake", h.conn, "hash-2");
        require(!h.supervisor->get_cached_schema("fake", "hash-1").has_value(),
                "config change drops old entry");
        require(h.supervisor->submit(make_request("c3")).succeeded(), "run after change");
        require(h.conn->list_count() == 2, "new hash lists again");

        require(h.supervisor->invalidate_schema("fake") == 1, "explicit invalidate");
        require(h.supervisor->submit(make_request("c4")).succeeded(), "run after invalidate");
        require(h.conn->list_count() == 3, "listed after invalidate");
    }});

    tests.push_back({"supervisor_duplicate_id_rejected_while_in_flight", [] {
        Harness h;
        auto first = h.supervisor->submit_async(make_request("dup", "return 'SLOW';"));
        require(wait_until([&h] { return is_active(*h.supervisor, "dup"); }, 5000), "in flight");

        auto second = h.supervisor->submit(make_request("dup"));
        require(second.error && second.error->kind == ErrorKind::DUPLICATE_EXECUTION,
                "DuplicateExecution");

        auto third = h.supervisor->submit_async(make_request("dup"));
        require(third.wait_for(std::chrono::seconds(0)) == std::future_status::ready,
                "async duplicate resolved immediately");
        require(third.get().error->kind == ErrorKind::DUPLICATE_EXECUTION, "async duplicate kind");

        require(h.supervisor->cancel("dup"), "cancel in-flight id");
        auto cancelled = first.get();
        require(cancelled.error && cancelled.error->kind == ErrorKind::CANCELLED, "first cancelled");

        require(h.supervisor->submit(make_request("dup")).succeeded(), "id reusable after completion");
    }});

    tests.push_back({"supervisor_cancel_unknown_id", [] {
        Harness h;
        require(!h.supervisor->cancel("nothing"), "nothing to cancel");
        require(h.supervisor->cancel_all() == 0, "nothing in flight");
    }});

    tests.push_back({"supervisor_distinct_ids_run_concurrently", [] {
        Harness h;
        std::vector<std::future<mcpguard::core::ExecutionResult>> slow;
        for (int i = 0; i < 3; ++i) {
            slow.push_back(h.supervisor->submit_async(
                make_request("slow" + std::to_string(i), "return 'SLOW';")));
        }
        require(wait_until([&h] { return h.supervisor->active_ids().size() == 3; }, 5000),
                "all three in flight together");

        auto quick = h.supervisor->submit(make_request("quick"));
        require(quick.succeeded(), "unrelated id not blocked");

        require(h.supervisor->cancel_all() == 3, "cancel everything");
        for (auto& f : slow) {
            auto result = f.get();
            require(result.error && result.error->kind == ErrorKind::CANCELLED, "cancelled");
        }
        h.supervisor->wait_idle();
        require(h.supervisor->active_ids().empty(), "active set drained");
    }});

    tests.push_back({"supervisor_request_policy_overrides_settings", [] {
        Harness h;
        auto request = make_request("p1", "return 'SLOW';");
        mcpguard::core::IsolationPolicy policy;
        policy.limits.cpu_ms = 300;
        request.policy = policy;

        auto started = std::chrono::steady_clock::now();
        auto result = h.supervisor->submit(request);
        require(result.error && result.error->kind == ErrorKind::TIMEOUT_ERROR, "request limit used");
        require(std::chrono::steady_clock::now() - started < std::chrono::seconds(5), "bounded");
    }});

    tests.push_back({"supervisor_destructor_cancels_in_flight", [] {
        Harness h;
        auto pending = h.supervisor->submit_async(make_request("late", "return 'SLOW';"));
        require(wait_until([&h] { return is_active(*h.supervisor, "late"); }, 5000), "in flight");
        auto started = std::chrono::steady_clock::now();
        h.supervisor.reset();
        require(std::chrono::steady_clock::now() - started < std::chrono::seconds(5), "prompt shutdown");
        require(pending.get().error->kind == ErrorKind::CANCELLED, "cancelled by shutdown");
    }});
}
