#include "runtime/sandbox_runner.hpp"
#include "runtime/artifact.hpp"
#include "runtime/diagnostics.hpp"
#include "runtime/sandbox.hpp"
#include "runtime/subprocess.hpp"
#include "bridge/frame.hpp"
#include "config/orchestrator_config.hpp"
#include "kernel/audit_log.hpp"
#include "util/scratch_workspace.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <sys/eventfd.h>
#include <sys/socket.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace mcpguard::runtime {

using json = nlohmann::json;
using core::ErrorKind;
using core::ExecutionError;
using core::ExecutionPhase;

RunnerOptions RunnerOptions::from_config(const config::OrchestratorConfig& config) {
    RunnerOptions opts;
    opts.scratch_root = config.scratch_root;
    opts.build_command = config.build_command;
    opts.runtime_command = config.runtime_command;
    opts.build_timeout_ms = config.build_timeout_ms;
    opts.timeout_grace_ms = config.timeout_grace_ms;
    opts.max_output_bytes = config.max_output_bytes;
    opts.enable_namespaces = config.enable_namespaces;
    opts.enable_cgroups = config.enable_cgroups;
    opts.cgroup_root = config.cgroup_root;
    return opts;
}

// Counts bridge workers still running, including ones whose run has ended
struct SandboxRunner::BridgeWorkers {
    std::mutex mutex;
    std::condition_variable cv;
    size_t running = 0;

    void begin() {
        std::lock_guard<std::mutex> lock(mutex);
        running++;
    }

    void end() {
        std::lock_guard<std::mutex> lock(mutex);
        running--;
        cv.notify_all();
    }

    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return running == 0; });
    }
};

namespace {

class PhaseTracker {
public:
    explicit PhaseTracker(core::ExecutionResult& result) : result_(result) {}

    void enter(ExecutionPhase phase) {
        current_ = phase;
        result_.phase_trace.push_back(phase);
    }

    void complete() {
        enter(ExecutionPhase::COMPLETED);
        result_.final_phase = ExecutionPhase::COMPLETED;
    }

    void fail(ExecutionError error) {
        result_.failed_phase = current_;
        result_.error = std::move(error);
        result_.phase_trace.push_back(ExecutionPhase::FAILED);
        result_.final_phase = ExecutionPhase::FAILED;
    }

    ExecutionPhase current() const { return current_; }

private:
    core::ExecutionResult& result_;
    ExecutionPhase current_ = ExecutionPhase::GENERATING;
};

// Closes on scope exit
struct ScopedFd {
    int fd = -1;

    ScopedFd() = default;
    explicit ScopedFd(int f) : fd(f) {}
    ~ScopedFd() { reset(); }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    void reset() {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
};

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Bounded by the runtime reading its replies; false if it stops doing so
bool send_all(int fd, const std::string& data, int stall_timeout_ms = 5000) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n > 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            struct pollfd pfd = {fd, POLLOUT, 0};
            int rc = poll(&pfd, 1, stall_timeout_ms);
            if (rc <= 0) return false;
            continue;
        }
        return false;
    }
    return true;
}

// false on EOF or hard error
template <typename Sink>
bool drain_fd(int fd, Sink&& sink) {
    char buf[16384];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            sink(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        return false;
    }
}

struct RuntimeOutcome {
    explicit RuntimeOutcome(size_t cap) : out(cap), err(cap) {}

    std::string start_error;
    bool timed_out = false;
    bool cancelled = false;
    std::string protocol_error;

    bool got_result = false;
    json result_value;
    std::optional<json> error_frame;

    CappedBuffer out;
    CappedBuffer err;

    int exit_code = -1;
    int term_signal = 0;
    bool oom_killed = false;
    core::IsolationStatus isolation;
};

// One request frame being answered off the poll loop. done_fd becomes
// readable once reply is set.
struct PendingCall {
    json id;
    int done_fd = -1;
    std::mutex mutex;
    bool done = false;
    bridge::BridgeReply reply;

    ~PendingCall() {
        if (done_fd >= 0) {
            close(done_fd);
        }
    }
};

// The runtime's end of fd 3: decodes frames, records the outcome frames and
// hands request frames to a worker, one at a time
class BridgeChannel {
public:
    BridgeChannel(std::shared_ptr<bridge::ToolBridge> tool_bridge,
                  std::shared_ptr<SandboxRunner::BridgeWorkers> workers,
                  const std::string& execution_id, int sock)
        : tool_bridge_(std::move(tool_bridge)), workers_(std::move(workers)),
          execution_id_(execution_id), sock_(sock) {}

    bridge::FrameDecoder& decoder() { return decoder_; }

    bool call_pending() const { return pending_ != nullptr; }
    int pending_fd() const { return pending_ ? pending_->done_fd : -1; }

    // Serves buffered frames until a request is handed off or the buffer
    // runs dry. Once the runtime is gone requests are dropped unanswered.
    void serve(bool runtime_alive, RuntimeOutcome& outcome) {
        while (outcome.protocol_error.empty() && !pending_) {
            auto line = decoder_.next();
            if (!line) {
                return;
            }
            if (line->empty()) {
                continue;
            }

            json frame;
            try {
                frame = json::parse(*line);
            } catch (const json::parse_error& e) {
                outcome.protocol_error = fmt::format("malformed bridge frame: {}", e.what());
                return;
            }

            bridge::FrameOp op = bridge::frame_op(frame);
            if (op == bridge::FrameOp::RESULT || op == bridge::FrameOp::ERROR) {
                if (outcome.got_result || outcome.error_frame) {
                    outcome.protocol_error = "runtime reported more than one outcome";
                    return;
                }
                if (op == bridge::FrameOp::RESULT) {
                    outcome.got_result = true;
                    outcome.result_value = frame.contains("value") ? frame["value"] : json(nullptr);
                } else {
                    outcome.error_frame = frame;
                }
                continue;
            }

            if (!runtime_alive) {
                spdlog::debug("[{}] bridge request after runtime exit dropped", execution_id_);
                continue;
            }
            start_call(std::move(frame), outcome);
        }
    }

    // Sends the finished reply and resumes serving
    void finish_call(RuntimeOutcome& outcome) {
        uint64_t ticks = 0;
        if (read(pending_->done_fd, &ticks, sizeof(ticks)) < 0 && errno != EAGAIN) {
            spdlog::debug("[{}] eventfd read failed: {}", execution_id_, strerror(errno));
        }

        bridge::BridgeReply reply;
        {
            std::lock_guard<std::mutex> lock(pending_->mutex);
            if (!pending_->done) {
                return;
            }
            reply = pending_->reply;
        }
        json id = pending_->id;
        pending_.reset();

        if (!send_all(sock_, core::dump_json(reply.to_frame(id)) + "\n")) {
            outcome.protocol_error = "runtime stopped reading the bridge channel";
            return;
        }
        serve(true, outcome);
    }

private:
    void start_call(json frame, RuntimeOutcome& outcome) {
        auto pending = std::make_shared<PendingCall>();
        pending->id = frame.is_object() && frame.contains("id") ? frame["id"] : json(nullptr);
        pending->done_fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
        if (pending->done_fd < 0) {
            outcome.protocol_error = fmt::format("eventfd failed: {}", strerror(errno));
            return;
        }

        workers_->begin();
        try {
            std::thread([tool_bridge = tool_bridge_, workers = workers_, pending,
                         frame = std::move(frame)]() mutable {
                bridge::BridgeReply reply;
                try {
                    reply = tool_bridge->handle_frame(frame);
                } catch (const std::exception& e) {
                    reply = bridge::BridgeReply::denied(core::ErrorKind::RUNTIME_ERROR,
                                                        fmt::format("bridge error: {}", e.what()));
                }
                {
                    std::lock_guard<std::mutex> lock(pending->mutex);
                    pending->reply = std::move(reply);
                    pending->done = true;
                }
                uint64_t one = 1;
                if (write(pending->done_fd, &one, sizeof(one)) != sizeof(one)) {
                    spdlog::debug("eventfd write failed: {}", strerror(errno));
                }
                // Nothing of the run may be held once the runner can be destroyed
                tool_bridge.reset();
                pending.reset();
                workers->end();
            }).detach();
        } catch (const std::system_error& e) {
            workers_->end();
            outcome.protocol_error = fmt::format("cannot start bridge worker: {}", e.what());
            return;
        }
        pending_ = std::move(pending);
    }

    bridge::FrameDecoder decoder_;
    std::shared_ptr<bridge::ToolBridge> tool_bridge_;
    std::shared_ptr<SandboxRunner::BridgeWorkers> workers_;
    std::string execution_id_;
    int sock_;
    std::shared_ptr<PendingCall> pending_;
};

std::string frame_string(const json& frame, const char* key) {
    if (frame.contains(key) && frame[key].is_string()) {
        return frame[key].get<std::string>();
    }
    return "";
}

std::vector<std::string> runtime_environment(const std::string& workdir) {
    return {
        "PATH=/usr/local/bin:/usr/bin:/bin",
        "HOME=" + workdir,
        "TMPDIR=" + workdir,
        "LANG=C.UTF-8"
    };
}

} // anonymous namespace

// ============================================================================
// SandboxRunner
// ============================================================================

SandboxRunner::SandboxRunner(RunnerOptions options, kernel::AuditLogger* audit)
    : options_(std::move(options)), audit_(audit),
      workers_(std::make_shared<BridgeWorkers>()) {}

SandboxRunner::~SandboxRunner() {
    workers_->wait_idle();
}

namespace {

RuntimeOutcome execute_runtime(const RunContext& ctx,
                               const RunnerOptions& opts,
                               const util::ScratchWorkspace& workspace,
                               const WrittenArtifact& written,
                               std::shared_ptr<bridge::ToolBridge> tool_bridge,
                               std::shared_ptr<SandboxRunner::BridgeWorkers> workers) {
    RuntimeOutcome outcome(opts.max_output_bytes);
    const core::IsolationPolicy& policy = *ctx.policy;

    int sv[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) < 0) {
        outcome.start_error = fmt::format("socketpair failed: {}", strerror(errno));
        return outcome;
    }
    ScopedFd sock(sv[0]);
    ScopedFd child_sock(sv[1]);

    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) < 0) {
        outcome.start_error = fmt::format("pipe2 failed: {}", strerror(errno));
        return outcome;
    }
    ScopedFd out_r(out_pipe[0]);
    ScopedFd out_w(out_pipe[1]);
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        outcome.start_error = fmt::format("pipe2 failed: {}", strerror(errno));
        return outcome;
    }
    ScopedFd err_r(err_pipe[0]);
    ScopedFd err_w(err_pipe[1]);

    SandboxConfig sb_config;
    sb_config.name = fs::path(workspace.path()).filename().string();
    sb_config.workdir = workspace.path();
    sb_config.cgroup_root = opts.cgroup_root;
    sb_config.isolation_requested = policy.isolation_enabled;
    sb_config.enable_namespaces = opts.enable_namespaces;
    sb_config.enable_cgroups = opts.enable_cgroups;
    sb_config.limits.memory_bytes = static_cast<uint64_t>(policy.limits.memory_mb) * 1024 * 1024;
    sb_config.limits.cpu_seconds = static_cast<int>((policy.limits.cpu_ms + 999) / 1000);

    auto argv = expand_template(opts.runtime_command, {
        {"artifact", written.artifact_path},
        {"workdir", workspace.path()},
        {"memory_mb", std::to_string(policy.limits.memory_mb)},
        {"cpu_ms", std::to_string(policy.limits.cpu_ms)}
    });

    Sandbox sandbox(sb_config);
    SandboxStdio stdio;
    stdio.stdout_fd = out_w.fd;
    stdio.stderr_fd = err_w.fd;
    stdio.channel_fd = child_sock.fd;

    std::string start_error;
    if (!sandbox.start(argv, runtime_environment(workspace.path()), stdio, &start_error)) {
        outcome.start_error = start_error;
        outcome.isolation = sandbox.isolation_status();
        return outcome;
    }
    out_w.reset();
    err_w.reset();
    child_sock.reset();

    set_nonblocking(sock.fd);
    set_nonblocking(out_r.fd);
    set_nonblocking(err_r.fd);

    BridgeChannel channel(std::move(tool_bridge), std::move(workers), ctx.execution_id, sock.fd);
    bool sock_open = true;
    bool out_open = true;
    bool err_open = true;
    int cancel_fd = ctx.cancel ? ctx.cancel->wait_fd() : -1;

    auto read_socket = [&]() {
        bool oversize = false;
        sock_open = drain_fd(sock.fd, [&](const char* data, size_t len) {
            if (!channel.decoder().feed(data, len)) oversize = true;
        });
        if (oversize && outcome.protocol_error.empty()) {
            outcome.protocol_error = fmt::format("bridge frame exceeds {} bytes", bridge::MAX_FRAME_BYTES);
        }
    };
    auto read_out = [&]() {
        out_open = drain_fd(out_r.fd, [&](const char* d, size_t n) { outcome.out.append(d, n); });
    };
    auto read_err = [&]() {
        err_open = drain_fd(err_r.fd, [&](const char* d, size_t n) { outcome.err.append(d, n); });
    };

    int64_t wall_ms = policy.limits.cpu_ms + opts.timeout_grace_ms;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(wall_ms);

    for (;;) {
        if (ctx.cancel && ctx.cancel->is_cancelled()) {
            outcome.cancelled = true;
            break;
        }
        if (!outcome.protocol_error.empty()) {
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            outcome.timed_out = true;
            break;
        }
        if (sandbox.poll_exit()) {
            break;
        }

        // The socket is left unread while a request is outstanding
        struct pollfd fds[5];
        nfds_t nfds = 0;
        int sock_idx = -1, out_idx = -1, err_idx = -1, call_idx = -1;
        if (channel.call_pending()) {
            call_idx = nfds;
            fds[nfds++] = {channel.pending_fd(), POLLIN, 0};
        } else if (sock_open) {
            sock_idx = nfds;
            fds[nfds++] = {sock.fd, POLLIN, 0};
        }
        if (out_open)  { out_idx = nfds;  fds[nfds++] = {out_r.fd, POLLIN, 0}; }
        if (err_open)  { err_idx = nfds;  fds[nfds++] = {err_r.fd, POLLIN, 0}; }
        if (cancel_fd >= 0) { fds[nfds++] = {cancel_fd, POLLIN, 0}; }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int slice = static_cast<int>(std::min<int64_t>(50, std::max<int64_t>(1, remaining)));

        int rc = poll(fds, nfds, slice);
        if (rc < 0) {
            if (errno == EINTR) continue;
            outcome.protocol_error = fmt::format("poll failed: {}", strerror(errno));
            break;
        }

        const short ready = POLLIN | POLLHUP | POLLERR;
        if (out_idx >= 0 && (fds[out_idx].revents & ready)) read_out();
        if (err_idx >= 0 && (fds[err_idx].revents & ready)) read_err();
        if (call_idx >= 0 && (fds[call_idx].revents & POLLIN)) {
            channel.finish_call(outcome);
        }
        if (sock_idx >= 0 && (fds[sock_idx].revents & ready)) {
            read_socket();
            channel.serve(true, outcome);
        }
    }

    if (outcome.timed_out || outcome.cancelled || !outcome.protocol_error.empty()) {
        sandbox.kill_all();
    }
    sandbox.wait();

    // Whatever the runtime wrote before exiting is still buffered
    if (out_open) read_out();
    if (err_open) read_err();
    if (sock_open && !channel.call_pending()) {
        read_socket();
        channel.serve(false, outcome);
    }

    outcome.exit_code = sandbox.exit_code();
    outcome.term_signal = sandbox.term_signal();
    outcome.oom_killed = sandbox.oom_killed();
    outcome.isolation = sandbox.isolation_status();
    sandbox.cleanup();
    return outcome;
}

// Exactly one classification per outcome, most specific first
void classify(const RuntimeOutcome& outcome, const Artifact& artifact,
              const RunContext& ctx, int64_t wall_ms, PhaseTracker& phases,
              core::ExecutionResult& result) {
    if (outcome.cancelled) {
        phases.fail(ExecutionError::make(ErrorKind::CANCELLED, "execution cancelled"));
        return;
    }
    if (outcome.timed_out || outcome.term_signal == SIGXCPU) {
        phases.fail(ExecutionError::make(ErrorKind::TIMEOUT_ERROR,
            fmt::format("execution exceeded {}ms (cpu limit {}ms)", wall_ms, ctx.policy->limits.cpu_ms)));
        return;
    }
    if (!outcome.protocol_error.empty()) {
        phases.fail(ExecutionError::make(ErrorKind::RUNTIME_ERROR, outcome.protocol_error));
        return;
    }
    if (outcome.error_frame) {
        const json& f = *outcome.error_frame;
        phases.fail(runtime_error_from_frame(frame_string(f, "name"), frame_string(f, "message"),
                                             frame_string(f, "stack"), artifact));
        return;
    }
    if (outcome.got_result && outcome.term_signal == 0 && outcome.exit_code == 0) {
        result.result = outcome.result_value;
        phases.complete();
        return;
    }
    if (outcome.oom_killed) {
        phases.fail(ExecutionError::make(ErrorKind::RUNTIME_ERROR,
            fmt::format("memory limit exceeded ({} MB)", ctx.policy->limits.memory_mb)));
        return;
    }
    if (outcome.term_signal != 0) {
        phases.fail(ExecutionError::make(ErrorKind::RUNTIME_ERROR,
            fmt::format("runtime killed by signal {} ({})", outcome.term_signal,
                        strsignal(outcome.term_signal))));
        return;
    }
    if (outcome.exit_code != 0) {
        std::string tail = last_line(result.stderr_text);
        phases.fail(ExecutionError::make(ErrorKind::RUNTIME_ERROR,
            tail.empty() ? fmt::format("runtime exited with code {}", outcome.exit_code)
                         : fmt::format("runtime exited with code {}: {}", outcome.exit_code, tail)));
        return;
    }
    phases.fail(ExecutionError::make(ErrorKind::RUNTIME_ERROR,
                                     "runtime exited without producing a result"));
}

} // anonymous namespace

core::ExecutionResult SandboxRunner::run(const RunContext& ctx) {
    auto started = std::chrono::steady_clock::now();
    core::ExecutionResult result;
    result.id = ctx.execution_id;
    result.isolation.requested = ctx.policy && ctx.policy->isolation_enabled;
    PhaseTracker phases(result);
    std::optional<util::ScratchWorkspace> workspace;

    auto finish = [&]() -> core::ExecutionResult {
        if (workspace) {
            if (!workspace->remove()) {
                spdlog::warn("[{}] scratch workspace {} could not be removed",
                             ctx.execution_id, workspace->path());
            }
        }
        result.duration_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count());
        if (audit_) {
            json details = {
                {"phase", core::phase_to_string(result.final_phase)},
                {"duration_ms", result.duration_ms},
                {"tool_calls", result.tool_call_log.size()}
            };
            if (result.error) {
                details["error_kind"] = core::error_kind_to_string(result.error->kind);
                details["failed_phase"] = core::phase_to_string(*result.failed_phase);
            }
            audit_->log_execution(result.succeeded() ? "EXECUTION_COMPLETED" : "EXECUTION_FAILED",
                                  ctx.execution_id, ctx.policy ? ctx.policy->mcp_name : "",
                                  details, result.succeeded());
        }
        spdlog::info("[{}] {} in {}ms{}", ctx.execution_id,
                     core::phase_to_string(result.final_phase), result.duration_ms,
                     result.error ? fmt::format(" ({}: {})",
                                                core::error_kind_to_string(result.error->kind),
                                                result.error->message)
                                  : "");
        return result;
    };
    auto cancelled = [&]() {
        return ctx.cancel && ctx.cancel->is_cancelled();
    };

    // ---- Generating --------------------------------------------------------
    phases.enter(ExecutionPhase::GENERATING);
    if (!ctx.policy) {
        phases.fail(ExecutionError::make(ErrorKind::GENERATION_ERROR, "no isolation policy"));
        return finish();
    }
    if (cancelled()) {
        phases.fail(ExecutionError::make(ErrorKind::CANCELLED, "execution cancelled"));
        return finish();
    }

    workspace = util::ScratchWorkspace::create(options_.scratch_root, ctx.execution_id);
    if (!workspace) {
        phases.fail(ExecutionError::make(ErrorKind::GENERATION_ERROR,
            fmt::format("cannot create scratch workspace under {}", options_.scratch_root)));
        return finish();
    }

    std::string gen_error;
    auto written = write_artifact(*workspace, ctx.execution_id, *ctx.policy, ctx.script_source,
                                  ctx.input_args, ctx.tool_names, &gen_error);
    if (!written) {
        phases.fail(ExecutionError::make(ErrorKind::GENERATION_ERROR, gen_error));
        return finish();
    }

    // ---- Building ----------------------------------------------------------
    if (cancelled()) {
        phases.fail(ExecutionError::make(ErrorKind::CANCELLED, "execution cancelled"));
        return finish();
    }
    phases.enter(ExecutionPhase::BUILDING);

    ProcessLimits build_limits;
    build_limits.timeout_ms = options_.build_timeout_ms;
    build_limits.max_output_bytes = options_.max_output_bytes;
    auto build_argv = expand_template(options_.build_command, {
        {"artifact", written->artifact_path},
        {"workdir", workspace->path()},
        {"memory_mb", std::to_string(ctx.policy->limits.memory_mb)},
        {"cpu_ms", std::to_string(ctx.policy->limits.cpu_ms)}
    });

    ProcessResult build = run_capture(build_argv, workspace->path(), build_limits, ctx.cancel.get());
    if (build.cancelled) {
        phases.fail(ExecutionError::make(ErrorKind::CANCELLED, "execution cancelled"));
        return finish();
    }
    if (!build.started) {
        phases.fail(ExecutionError::make(ErrorKind::BUILD_ERROR,
            fmt::format("cannot run build toolchain: {}", build.error)));
        return finish();
    }
    if (build.timed_out) {
        phases.fail(ExecutionError::make(ErrorKind::BUILD_ERROR,
            fmt::format("build toolchain timed out after {}ms", options_.build_timeout_ms)));
        return finish();
    }
    if (!build.exited_cleanly()) {
        result.stdout_text = build.stdout_text;
        result.stderr_text = build.stderr_text;
        result.stdout_truncated = build.stdout_truncated;
        result.stderr_truncated = build.stderr_truncated;
        int code = build.term_signal ? 128 + build.term_signal : build.exit_code;
        phases.fail(build_error_from_output(build.stderr_text, build.stdout_text, code,
                                            written->artifact));
        return finish();
    }

    // ---- Executing ---------------------------------------------------------
    if (cancelled()) {
        phases.fail(ExecutionError::make(ErrorKind::CANCELLED, "execution cancelled"));
        return finish();
    }
    phases.enter(ExecutionPhase::EXECUTING);

    auto tool_bridge = std::make_shared<bridge::ToolBridge>(ctx.execution_id, ctx.policy, ctx.tool_names,
                                                            ctx.connection, audit_, ctx.fetcher);
    RuntimeOutcome outcome = execute_runtime(ctx, options_, *workspace, *written, tool_bridge, workers_);

    result.isolation = outcome.isolation;
    result.stdout_truncated = outcome.out.truncated();
    result.stderr_truncated = outcome.err.truncated();
    result.stdout_text = outcome.out.take();
    result.stderr_text = outcome.err.take();
    result.tool_call_log = tool_bridge->call_log();

    if (audit_ && result.isolation.is_degraded()) {
        audit_->log_security("DEGRADED_ISOLATION", ctx.execution_id, ctx.policy->mcp_name,
                             {{"reason", result.isolation.degraded_reason}});
    }

    if (!outcome.start_error.empty()) {
        phases.fail(ExecutionError::make(ErrorKind::RUNTIME_ERROR,
            fmt::format("cannot start runtime: {}", outcome.start_error)));
        return finish();
    }

    int64_t wall_ms = ctx.policy->limits.cpu_ms + options_.timeout_grace_ms;
    classify(outcome, written->artifact, ctx, wall_ms, phases, result);
    if (audit_ && result.error && result.error->kind == ErrorKind::TIMEOUT_ERROR) {
        audit_->log_security("TIMEOUT_KILL", ctx.execution_id, ctx.policy->mcp_name,
                             {{"cpu_ms", ctx.policy->limits.cpu_ms}, {"wall_ms", wall_ms}});
    }
    return finish();
}

} // namespace mcpguard::runtime
