#include "test_framework.hpp"
#include "helpers/test_helpers.hpp"
#include "config/orchestrator_config.hpp"
#include "kernel/audit_log.hpp"
#include "runtime/artifact.hpp"
#include "runtime/sandbox_runner.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using json = nlohmann::json;
using mcpguard::core::ErrorKind;
using mcpguard::core::ExecutionPhase;
using mcpguard::core::IsolationPolicy;
using mcpguard::runtime::RunContext;
using mcpguard::runtime::RunnerOptions;
using mcpguard::runtime::SandboxRunner;

namespace {

namespace fs = std::filesystem;

// Runner wired to shell stand-ins for the toolchain, without OS isolation
// so results do not depend on the host's namespace and cgroup support
RunnerOptions shell_options(const mcpguard::tests::TempDir& dir,
                            const fs::path& build, const fs::path& runtime) {
    fs::create_directories(dir / "scratch");
    RunnerOptions opts;
    opts.scratch_root = (dir / "scratch").string();
    opts.build_command = {"/bin/sh", build.string(), "{artifact}"};
    opts.runtime_command = {"/bin/sh", runtime.string(), "{artifact}"};
    opts.build_timeout_ms = 5000;
    opts.timeout_grace_ms = 100;
    opts.enable_namespaces = false;
    opts.enable_cgroups = false;
    return opts;
}

RunContext make_context(const std::string& id, int64_t cpu_ms = 5000) {
    auto policy = std::make_shared<IsolationPolicy>();
    policy->mcp_name = "fake";
    policy->limits.cpu_ms = cpu_ms;
    RunContext ctx;
    ctx.execution_id = id;
    ctx.script_source = "return 1;";
    ctx.policy = policy;
    return ctx;
}

bool scratch_empty(const mcpguard::tests::TempDir& dir) {
    std::error_code ec;
    return fs::is_empty(dir / "scratch", ec) && !ec;
}

const char* BUILD_OK = "exit 0\n";

// Answers every call after a fixed delay
class SlowConnection : public mcpguard::bridge::ToolServerConnection {
public:
    explicit SlowConnection(std::chrono::milliseconds delay) : delay_(delay) {}

    std::optional<std::vector<mcpguard::core::ToolDescriptor>> list_tools(std::string*) override {
        mcpguard::core::ToolDescriptor tool;
        tool.name = "search";
        return std::vector<mcpguard::core::ToolDescriptor>{tool};
    }

    mcpguard::bridge::ToolCallOutcome call_tool(const std::string& name, const json&) override {
        std::this_thread::sleep_for(delay_);
        finished_++;
        mcpguard::bridge::ToolCallOutcome outcome;
        outcome.ok = true;
        outcome.result = {{"tool", name}};
        return outcome;
    }

    std::string name() const override { return "slow"; }

    int finished() const { return finished_.load(); }

private:
    std::chrono::milliseconds delay_;
    std::atomic<int> finished_{0};
};

// Runtime that makes one tool call and waits for the reply
const char* CALL_AND_WAIT =
    "printf '{\"op\":\"call\",\"id\":1,\"tool\":\"search\",\"args\":{}}\\n' >&3\n"
    "read -r reply <&3\n"
    "printf '{\"op\":\"result\",\"value\":%s}\\n' \"$reply\" >&3\n";

} // anonymous namespace

void register_sandbox_runner_tests(std::vector<mcpguard::tests::TestCase>& tests) {
    using mcpguard::tests::require;
    using mcpguard::tests::TempDir;
    using mcpguard::tests::write_text;

    // ========================================================================
    // Phase flow with shell toolchains
    // ========================================================================

    tests.push_back({"runner_completes_with_result_frame", [] {
        TempDir dir;
        write_text(dir / "build.sh", BUILD_OK);
        write_text(dir / "run.sh",
                   "echo hello\n"
                   "printf '{\"op\":\"result\",\"value\":2}\\n' >&3\n");
        mcpguard::kernel::AuditLogger audit;
        SandboxRunner runner(shell_options(dir, dir / "build.sh", dir / "run.sh"), &audit);

        auto result = runner.run(make_context("ok1"));
        require(result.succeeded(), "completed: " + (result.error ? result.error->message : ""));
        require(result.result == 2, "result value");
        require(result.stdout_text == "hello\n", "stdout captured");
        require(!result.failed_phase.has_value(), "no failed phase");
        require(result.phase_trace.size() == 4, "Generating, Building, Executing, Completed");
        require(result.phase_trace.front() == ExecutionPhase::GENERATING, "starts generating");
        require(scratch_empty(dir), "workspace removed");

        auto entries = audit.get_entries(mcpguard::kernel::AuditCategory::EXECUTION, std::string("ok1"));
        require(!entries.empty() && entries.back().event_type == "EXECUTION_COMPLETED", "audited");
    }});

    tests.push_back({"runner_artifact_handed_to_toolchain", [] {
        TempDir dir;
        write_text(dir / "build.sh", "grep -q 'return 1;' \"$1\" || exit 9\n");
        write_text(dir / "run.sh",
                   "test -f \"$(dirname \"$1\")/manifest.json\" || exit 7\n"
                   "printf '{\"op\":\"result\",\"value\":\"seen\"}\\n' >&3\n");
        SandboxRunner runner(shell_options(dir, dir / "build.sh", dir / "run.sh"));

        auto result = runner.run(make_context("art1"));
        require(result.succeeded(), "artifact and manifest present");
        require(result.result == "seen", "result");
    }});

    tests.push_back({"runner_build_failure_maps_location", [] {
        TempDir dir;
        RunContext ctx = make_context("build1");
        ctx.script_source = "const a = 1;\nconst b = ;\nreturn a;";
        auto artifact = mcpguard::runtime::assemble_artifact(ctx.script_source, ctx.input_args,
                                                             ctx.tool_names);
        int reported = artifact.line_offset + 2;
        write_text(dir / "build.sh",
                   "echo \"$1:" + std::to_string(reported) + ":11: error: Unexpected token ';'\" >&2\n"
                   "exit 1\n");
        write_text(dir / "run.sh", "exit 0\n");
        SandboxRunner runner(shell_options(dir, dir / "build.sh", dir / "run.sh"));

        auto result = runner.run(ctx);
        require(!result.succeeded(), "failed");
        require(result.error->kind == ErrorKind::BUILD_ERROR, "BuildError");
        require(result.failed_phase == ExecutionPhase::BUILDING, "failed while building");
        require(result.error->line == 2, "mapped to script line");
        require(result.error->column == 11, "column kept");
        require(result.error->message.find("Unexpected token") != std::string::npos, "message");
        require(scratch_empty(dir), "workspace removed");
    }});

    tests.push_back({"runner_build_failure_without_location", [] {
        TempDir dir;
        write_text(dir / "build.sh", "echo 'toolchain crashed' >&2\nexit 3\n");
        write_text(dir / "run.sh", "exit 0\n");
        SandboxRunner runner(shell_options(dir, dir / "build.sh", dir / "run.sh"));

        auto result = runner.run(make_context("build2"));
        require(result.error && result.error->kind == ErrorKind::BUILD_ERROR, "BuildError");
        require(!result.error->line.has_value(), "no location");
        require(result.stderr_text.find("toolchain crashed") != std::string::npos, "output kept");
    }});

    tests.push_back({"runner_build_toolchain_missing_or_hung", [] {
        TempDir dir;
        write_text(dir / "run.sh", "exit 0\n");
        write_text(dir / "hang.sh", "sleep 10\n");

        RunnerOptions missing = shell_options(dir, dir / "hang.sh", dir / "run.sh");
        missing.build_command = {"/nonexistent/build-tool", "{artifact}"};
        auto absent = SandboxRunner(missing).run(make_context("build3"));
        require(absent.error && absent.error->kind == ErrorKind::BUILD_ERROR, "missing toolchain");

        RunnerOptions slow = shell_options(dir, dir / "hang.sh", dir / "run.sh");
        slow.build_timeout_ms = 200;
        auto started = std::chrono::steady_clock::now();
        auto hung = SandboxRunner(slow).run(make_context("build4"));
        require(hung.error && hung.error->kind == ErrorKind::BUILD_ERROR, "hung toolchain");
        require(hung.error->message.find("timed out") != std::string::npos, "timeout message");
        require(std::chrono::steady_clock::now() - started < std::chrono::seconds(5), "bounded");
        require(scratch_empty(dir), "workspaces removed");
    }});

    // ========================================================================
    // Executing
    // ========================================================================

    tests.push_back({"runner_serves_tool_calls_over_channel", [] {
        TempDir dir;
        write_text(dir / "build.sh", BUILD_OK);
        write_text(dir / "run.sh",
                   "printf '{\"op\":\"call\",\"id\":1,\"tool\":\"search\",\"args\":{\"q\":\"x\"}}\\n' >&3\n"
                   "read -r reply <&3\n"
                   "printf '{\"op\":\"result\",\"value\":%s}\\n' \"$reply\" >&3\n");
        SandboxRunner runner(shell_options(dir, dir / "build.sh", dir / "run.sh"));

        auto conn = std::make_shared<mcpguard::tests::FakeConnection>(std::vector<std::string>{"search"});
        RunContext ctx = make_context("call1");
        ctx.tool_names = {"search"};
        ctx.connection = conn;

        auto result = runner.run(ctx);
        require(result.succeeded(), "completed: " + (result.error ? result.error->message : ""));
        require(result.result["id"] == 1, "reply correlated by id");
        require(result.result["ok"] == true, "call succeeded");
        require(result.result["value"]["args"]["q"] == "x", "arguments forwarded");
        require(result.tool_call_log.size() == 1, "call logged");
        require(conn->calls().size() == 1, "one forward");
    }});

    tests.push_back({"runner_unknown_tool_reply_does_not_fail_run", [] {
        TempDir dir;
        write_text(dir / "build.sh", BUILD_OK);
        write_text(dir / "run.sh",
                   "printf '{\"op\":\"call\",\"id\":1,\"tool\":\"drop_db\",\"args\":{}}\\n' >&3\n"
                   "read -r reply <&3\n"
                   "printf '{\"op\":\"result\",\"value\":%s}\\n' \"$reply\" >&3\n");
        SandboxRunner runner(shell_options(dir, dir / "build.sh", dir / "run.sh"));

        auto conn = std::make_shared<mcpguard::tests::FakeConnection>(std::vector<std::string>{"search"});
        RunContext ctx = make_context("call2");
        ctx.tool_names = {"search"};
        ctx.connection = conn;

        auto result = runner.run(ctx);
        require(result.succeeded(), "script decides what a denial means");
        require(result.result["ok"] == false, "denied");
        require(result.result["error"]["kind"] == "UnknownTool", "kind visible to script");
        require(conn->calls().empty(), "not forwarded");
    }});

    tests.push_back({"runner_binary_file_read_is_answered", [] {
        TempDir dir;
        write_text(dir / "build.sh", BUILD_OK);
        write_text(dir / "blob.bin", std::string("\xff\xfe ok"));
        write_text(dir / "run.sh",
                   "printf '{\"op\":\"read\",\"id\":7,\"path\":\"" + (dir / "blob.bin").string() + "\"}\\n' >&3\n"
                   "read -r reply <&3\n"
                   "printf '{\"op\":\"result\",\"value\":%s}\\n' \"$reply\" >&3\n");
        SandboxRunner runner(shell_options(dir, dir / "build.sh", dir / "run.sh"));

        auto policy = std::make_shared<IsolationPolicy>();
        policy->mcp_name = "fake";
        policy->file_system.enabled = true;
        policy->file_system.read_paths = {dir.path().string()};
        RunContext ctx = make_context("bin1");
        ctx.policy = policy;

        auto result = runner.run(ctx);
        require(result.succeeded(), "completed: " + (result.error ? result.error->message : ""));
        require(result.result["id"] == 7 && result.result["ok"] == true, "read answered");
        auto content = result.result["value"].get<std::string>();
        require(content.find("\xEF\xBF\xBD") != std::string::npos, "invalid bytes replaced");
        require(content.find("ok") != std::string::npos, "valid bytes kept");
        require(scratch_empty(dir), "workspace removed");
    }});

    tests.push_back({"runner_slow_tool_call_does_not_hold_deadline", [] {
        TempDir dir;
        write_text(dir / "build.sh", BUILD_OK);
        write_text(dir / "run.sh", CALL_AND_WAIT);
        auto conn = std::make_shared<SlowConnection>(std::chrono::milliseconds(1500));
        {
            SandboxRunner runner(shell_options(dir, dir / "build.sh", dir / "run.sh"));
            RunContext ctx = make_context("slowcall1", 200);
            ctx.tool_names = {"search"};
            ctx.connection = conn;

            auto started = std::chrono::steady_clock::now();
            auto result = runner.run(ctx);
            auto elapsed = std::chrono::steady_clock::now() - started;
            require(result.error && result.error->kind == ErrorKind::TIMEOUT_ERROR, "TimeoutError");
            require(elapsed < std::chrono::milliseconds(1000), "deadline kept during the call");
            require(scratch_empty(dir), "workspace removed");
        }
        require(conn->finished() == 1, "runner waited for the abandoned call");
    }});

    tests.push_back({"runner_cancel_during_slow_tool_call", [] {
        TempDir dir;
        write_text(dir / "build.sh", BUILD_OK);
        write_text(dir / "run.sh", CALL_AND_WAIT);
        auto conn = std::make_shared<SlowConnection>(std::chrono::milliseconds(1500));
        SandboxRunner runner(shell_options(dir, dir / "build.sh", dir / "run.sh"));

        RunContext ctx = make_context("slowcall2", 20000);
        ctx.tool_names = {"search"};
        ctx.connection = conn;
        ctx.cancel = std::make_shared<mcpguard::runtime::CancellationToken>();
        auto token = ctx.cancel;
        std::thread canceller([token]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            token->cancel();
        });
        auto started = std::chrono::steady_clock::now();
        auto result = runner.run(ctx);
        auto elapsed = std::chrono::steady_clock::now() - started;
        canceller.join();
        require(result.error && result.error->kind == ErrorKind::CANCELLED, "Cancelled");
        require(elapsed < std::chrono::milliseconds(1000), "cancel seen during the call");
    }});

    tests.push_back({"runner_slow_tool_call_completes_within_limit", [] {
        TempDir dir;
        write_text(dir / "build.sh", BUILD_OK);
        write_text(dir / "run.sh", CALL_AND_WAIT);
        SandboxRunner runner(shell_options(dir, dir / "build.sh", dir / "run.sh"));

        RunContext ctx = make_context("slowcall3");
        ctx.tool_names = {"search"};
        ctx.connection = std::make_shared<SlowConnection>(std::chrono::milliseconds(200));
        auto result = runner.run(ctx);
        require(result.succeeded(), "completed: " + (result.error ? result.error->message : ""));
        require(result.result["ok"] == true && result.result["value"]["tool"] == "search",
                "reply delivered after the wait");
        require(result.tool_call_log.size() == 1, "call logged");
    }});

    tests.push_back({"runner_error_frame_is_runtime_error", [] {
        TempDir dir;
        write_text(dir / "build.sh", BUILD_OK);
        write_text(dir / "run.sh",
                   "printf '{\"op\":\"error\",\"name\":\"TypeError\",\"message\":\"boom\",\"stack\":\"\"}\\n' >&3\n"
                   "exit 1\n");
        SandboxRunner runner(shell_options(dir, dir / "build.sh", dir / "run.sh"));

        auto result = runner.run(make_context("err1"));
        require(result.error && result.error->kind == ErrorKind::RUNTIME_ERROR, "RuntimeError");
        require(result.failed_phase == ExecutionPhase::EXECUTING, "failed while executing");
        require(result.error->message.find("boom") != std::string::npos, "message kept");
    }});

    tests.push_back({"runner_exit_without_result", [] {
        TempDir dir;
        write_text(dir / "build.sh", BUILD_OK);
        write_text(dir / "run.sh", "echo 'fatal: out of luck' >&2\nexit 4\n");
        SandboxRunner runner(shell_options(dir, dir / "build.sh", dir / "run.sh"));

        auto result = runner.run(make_context("err2"));
        require(result.error && result.error->kind == ErrorKind::RUNTIME_ERROR, "RuntimeError");
        require(result.error->message.find("code 4") != std::string::npos, "exit code reported");
        require(result.error->message.find("out of luck") != std::string::npos, "stderr tail");

        write_text(dir / "run.sh", "exit 0\n");
        auto silent = runner.run(make_context("err3"));
        require(silent.error && silent.error->kind == ErrorKind::RUNTIME_ERROR, "no result frame");
    }});

    tests.push_back({"runner_malformed_frame_kills_runtime", [] {
        TempDir dir;
        write_text(dir / "build.sh", BUILD_OK);
        write_text(dir / "run.sh", "printf 'not json\\n' >&3\nsleep 30\n");
        SandboxRunner runner(shell_options(dir, dir / "build.sh", dir / "run.sh"));

        auto started = std::chrono::steady_clock::now();
        auto result = runner.run(make_context("bad1"));
        require(result.error && result.error->kind == ErrorKind::RUNTIME_ERROR, "RuntimeError");
        require(result.error->message.find("malformed") != std::string::npos, "protocol error");
        require(std::chrono::steady_clock::now() - started < std::chrono::seconds(5), "not waited out");
    }});

    tests.push_back({"runner_timeout_kills_and_cleans_up", [] {
        TempDir dir;
        write_text(dir / "build.sh", BUILD_OK);
        write_text(dir / "run.sh", "sleep 30\n");
        mcpguard::kernel::AuditLogger audit;
        SandboxRunner runner(shell_options(dir, dir / "build.sh", dir / "run.sh"), &audit);

        auto started = std::chrono::steady_clock::now();
        auto result = runner.run(make_context("slow1", 300));
        auto elapsed = std::chrono::steady_clock::now() - started;
        require(result.error && result.error->kind == ErrorKind::TIMEOUT_ERROR, "TimeoutError");
        require(result.failed_phase == ExecutionPhase::EXECUTING, "failed while executing");
        require(elapsed < std::chrono::seconds(5), "killed near the deadline");
        require(scratch_empty(dir), "workspace removed");

        auto security = audit.get_entries(mcpguard::kernel::AuditCategory::SECURITY, std::string("slow1"));
        bool kill_logged = false;
        for (const auto& entry : security) {
            if (entry.event_type == "TIMEOUT_KILL") kill_logged = true;
        }
        require(kill_logged, "timeout kill audited");
    }});

    tests.push_back({"runner_cancellation", [] {
        TempDir dir;
        write_text(dir / "build.sh", BUILD_OK);
        write_text(dir / "run.sh", "sleep 30\n");
        SandboxRunner runner(shell_options(dir, dir / "build.sh", dir / "run.sh"));

        RunContext early = make_context("cancel1");
        early.cancel = std::make_shared<mcpguard::runtime::CancellationToken>();
        early.cancel->cancel();
        auto before = runner.run(early);
        require(before.error && before.error->kind == ErrorKind::CANCELLED, "cancelled up front");
        require(before.failed_phase == ExecutionPhase::GENERATING, "nothing ran");

        RunContext running = make_context("cancel2", 20000);
        running.cancel = std::make_shared<mcpguard::runtime::CancellationToken>();
        auto token = running.cancel;
        std::thread canceller([token]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            token->cancel();
        });
        auto started = std::chrono::steady_clock::now();
        auto during = runner.run(running);
        canceller.join();
        require(during.error && during.error->kind == ErrorKind::CANCELLED, "cancelled mid-run");
        require(std::chrono::steady_clock::now() - started < std::chrono::seconds(5), "stopped promptly");
        require(scratch_empty(dir), "workspaces removed");
    }});

    tests.push_back({"runner_missing_runtime_binary", [] {
        TempDir dir;
        write_text(dir / "build.sh", BUILD_OK);
        RunnerOptions opts = shell_options(dir, dir / "build.sh", dir / "build.sh");
        opts.runtime_command = {"/nonexistent/runtime", "{artifact}"};
        auto result = SandboxRunner(opts).run(make_context("rt1"));
        require(result.error && result.error->kind == ErrorKind::RUNTIME_ERROR, "RuntimeError");
        require(scratch_empty(dir), "workspace removed");
    }});

    // ========================================================================
    // Real toolchain; skipped when node is not installed
    // ========================================================================

    auto node_options = [](const TempDir& dir) {
        mcpguard::config::OrchestratorConfig config;
        RunnerOptions opts = RunnerOptions::from_config(config);
        fs::create_directories(dir / "scratch");
        opts.scratch_root = (dir / "scratch").string();
        opts.enable_namespaces = false;
        opts.enable_cgroups = false;
        return opts;
    };

    tests.push_back({"runner_node_returns_value", [node_options] {
        if (!mcpguard::tests::node_available()) mcpguard::tests::skip("node not installed");
        TempDir dir;
        SandboxRunner runner(node_options(dir));
        RunContext ctx = make_context("node1");
        ctx.script_source = "const r = 1 + 1;\nreturn r;";
        auto result = runner.run(ctx);
        require(result.succeeded(), "completed: " + (result.error ? result.error->message : ""));
        require(result.result == 2, "value");
    }});

    tests.push_back({"runner_node_syntax_error", [node_options] {
        if (!mcpguard::tests::node_available()) mcpguard::tests::skip("node not installed");
        TempDir dir;
        SandboxRunner runner(node_options(dir));
        RunContext ctx = make_context("node2");
        ctx.script_source = "const ok = 1;\nesult = {};const r\nreturn ok;";
        auto result = runner.run(ctx);
        require(result.error && result.error->kind == ErrorKind::BUILD_ERROR, "BuildError");
        require(result.error->line.has_value(), "location reported");
        require(*result.error->line >= 1 && *result.error->line <= 3, "inside the script");
    }});

    tests.push_back({"runner_node_unknown_tool_still_completes", [node_options] {
        if (!mcpguard::tests::node_available()) mcpguard::tests::skip("node not installed");
        TempDir dir;
        SandboxRunner runner(node_options(dir));
        RunContext ctx = make_context("node3");
        ctx.tool_names = {"search"};
        ctx.connection = std::make_shared<mcpguard::tests::FakeConnection>(std::vector<std::string>{"search"});
        ctx.script_source =
            "const r = await mcp.callTool('drop_db', {});\n"
            "return r.isError ? r.error.kind : 'allowed';";
        auto result = runner.run(ctx);
        require(result.succeeded(), "completed: " + (result.error ? result.error->message : ""));
        require(result.result == "UnknownTool", "script saw the denial");
    }});

    tests.push_back({"runner_node_busy_loop_times_out", [node_options] {
        if (!mcpguard::tests::node_available()) mcpguard::tests::skip("node not installed");
        TempDir dir;
        SandboxRunner runner(node_options(dir));
        RunContext ctx = make_context("node4", 1000);
        ctx.script_source = "while (true) {}";
        auto result = runner.run(ctx);
        require(result.error && result.error->kind == ErrorKind::TIMEOUT_ERROR, "TimeoutError");
        require(scratch_empty(dir), "workspace removed after the kill");
    }});
}
