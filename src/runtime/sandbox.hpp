/**
 * mcpguard Sandbox
 *
 * Starts the untrusted runtime in fresh user, PID and network namespaces,
 * assigns it to a per-execution cgroup v2 (memory.max, pids.max) and applies
 * rlimits. Without the privileges for namespaces it falls back to a plain
 * fork and reports the degradation through IsolationStatus.
 *
 * The child sees exactly four descriptors: 0 stdin (/dev/null unless given),
 * 1 stdout, 2 stderr, 3 bridge channel.
 */
#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <sys/types.h>
#include "core/types.hpp"

namespace mcpguard::runtime {

struct SandboxLimits {
    uint64_t memory_bytes = 128ull * 1024 * 1024;
    uint64_t max_pids = 64;
    int cpu_seconds = 30;                       // RLIMIT_CPU, rounded up
    uint64_t max_file_bytes = 64ull * 1024 * 1024;
    uint64_t max_open_files = 64;
};

struct SandboxConfig {
    std::string name;                           // unique per execution
    std::string workdir;
    std::string cgroup_root = "/sys/fs/cgroup/mcpguard";
    SandboxLimits limits;

    bool isolation_requested = true;            // false = plain fork, rlimits only
    bool enable_namespaces = true;
    bool enable_cgroups = true;
};

// Parent-side descriptors wired onto the child's 0..3
struct SandboxStdio {
    int stdin_fd = -1;                          // -1 = /dev/null
    int stdout_fd = -1;
    int stderr_fd = -1;
    int channel_fd = -1;
};

class Sandbox {
public:
    explicit Sandbox(SandboxConfig config);
    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // argv[0] is resolved on the orchestrator's PATH; env replaces the
    // child's environment entirely
    bool start(const std::vector<std::string>& argv,
               const std::vector<std::string>& env,
               const SandboxStdio& stdio,
               std::string* error = nullptr);

    // SIGKILL to the whole process tree
    void kill_all();

    // Non-blocking reap; true once the child has exited
    bool poll_exit();

    // Blocking reap
    void wait();

    bool started() const { return pid_ > 0; }
    bool exited() const { return exited_; }
    pid_t pid() const { return pid_; }
    int exit_code() const { return exit_code_; }       // -1 unless exited normally
    int term_signal() const { return term_signal_; }   // 0 unless killed by a signal

    // True when the cgroup recorded an OOM kill
    bool oom_killed() const;

    const core::IsolationStatus& isolation_status() const { return status_; }
    const std::string& name() const { return config_.name; }

    // Removes the cgroup directory; the child must have been reaped
    void cleanup();

private:
    bool setup_cgroup();
    bool assign_cgroup(pid_t pid);
    bool write_id_maps(pid_t pid);
    void record_status(int status);
    void add_degraded(const std::string& reason);

    SandboxConfig config_;
    std::string cgroup_path_;
    bool cgroup_created_ = false;

    pid_t pid_ = -1;
    bool exited_ = false;
    int exit_code_ = -1;
    int term_signal_ = 0;

    core::IsolationStatus status_;
};

} // namespace mcpguard::runtime
