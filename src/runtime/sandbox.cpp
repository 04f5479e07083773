#include "runtime/sandbox.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <sched.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <thread>
#include <chrono>

namespace fs = std::filesystem;

namespace mcpguard::runtime {

// Stack size for clone()
constexpr size_t STACK_SIZE = 1024 * 1024;

namespace {

// Everything the child needs, prepared before clone so the child never
// allocates
struct ChildArgs {
    std::vector<char*> argv;
    std::vector<char*> envp;
    const char* workdir = nullptr;
    SandboxStdio stdio;
    int sync_fd[2] = {-1, -1};
    SandboxLimits limits;
};

void child_fail(const char* what) {
    const char prefix[] = "mcpguard sandbox: ";
    ssize_t ignored = write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
    ignored = write(STDERR_FILENO, what, strlen(what));
    ignored = write(STDERR_FILENO, "\n", 1);
    (void)ignored;
    _exit(127);
}

// dup2 leaves FD_CLOEXEC set when source and target are equal
bool wire_fd(int src, int target) {
    if (src == target) {
        int flags = fcntl(src, F_GETFD);
        return flags >= 0 && fcntl(src, F_SETFD, flags & ~FD_CLOEXEC) == 0;
    }
    return dup2(src, target) == target;
}

bool set_rlimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    return setrlimit(resource, &rl) == 0;
}

int child_entry(void* arg) {
    ChildArgs* args = static_cast<ChildArgs*>(arg);

    // Wait until the parent has written id maps and joined us to the cgroup
    close(args->sync_fd[1]);
    char go = 0;
    ssize_t n;
    do {
        n = read(args->sync_fd[0], &go, 1);
    } while (n < 0 && errno == EINTR);
    close(args->sync_fd[0]);
    if (n != 1 || go != 'x') {
        _exit(127);
    }

    setpgid(0, 0);
    prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    prctl(PR_SET_PDEATHSIG, SIGKILL);
    signal(SIGPIPE, SIG_DFL);
    sigset_t unblocked;
    sigemptyset(&unblocked);
    sigprocmask(SIG_SETMASK, &unblocked, nullptr);

    int in_fd = args->stdio.stdin_fd;
    if (in_fd < 0) {
        in_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    }
    if (in_fd < 0 || !wire_fd(in_fd, STDIN_FILENO)) child_fail("cannot wire stdin");
    if (!wire_fd(args->stdio.stdout_fd, STDOUT_FILENO)) child_fail("cannot wire stdout");
    if (!wire_fd(args->stdio.stderr_fd, STDERR_FILENO)) child_fail("cannot wire stderr");
    if (!wire_fd(args->stdio.channel_fd, 3)) child_fail("cannot wire bridge channel");

#ifdef SYS_close_range
    syscall(SYS_close_range, 4u, ~0u, 0u);
#endif

    if (args->workdir && chdir(args->workdir) < 0) {
        child_fail("cannot enter workdir");
    }

    const SandboxLimits& lim = args->limits;
    // SIGXCPU at the soft limit, SIGKILL one second later
    if (lim.cpu_seconds > 0) {
        rlim_t secs = static_cast<rlim_t>(lim.cpu_seconds);
        set_rlimit(RLIMIT_CPU, secs, secs + 1);
    }
    if (lim.max_file_bytes > 0) {
        rlim_t bytes = static_cast<rlim_t>(lim.max_file_bytes);
        set_rlimit(RLIMIT_FSIZE, bytes, bytes);
    }
    if (lim.max_open_files > 0) {
        rlim_t files = static_cast<rlim_t>(lim.max_open_files);
        set_rlimit(RLIMIT_NOFILE, files, files);
    }
    set_rlimit(RLIMIT_CORE, 0, 0);

    execvpe(args->argv[0], args->argv.data(), args->envp.data());
    child_fail("exec failed");
    return 127;
}

bool write_file(const std::string& path, const std::string& value) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        return false;
    }
    ofs << value;
    ofs.flush();
    return ofs.good();
}

} // anonymous namespace

// ============================================================================
// Sandbox Implementation
// ============================================================================

Sandbox::Sandbox(SandboxConfig config)
    : config_(std::move(config)) {
    cgroup_path_ = config_.cgroup_root + "/" + config_.name;
    status_.requested = config_.isolation_requested;
}

Sandbox::~Sandbox() {
    if (pid_ > 0 && !exited_) {
        kill_all();
        wait();
    }
    cleanup();
}

void Sandbox::add_degraded(const std::string& reason) {
    if (!status_.degraded_reason.empty()) {
        status_.degraded_reason += "; ";
    }
    status_.degraded_reason += reason;
}

bool Sandbox::setup_cgroup() {
    if (!fs::exists("/sys/fs/cgroup/cgroup.controllers")) {
        spdlog::warn("DEGRADED ISOLATION: cgroup v2 not available - memory and pid limits will NOT be enforced");
        add_degraded("cgroup v2 not available");
        return false;
    }

    std::error_code ec;
    fs::create_directories(cgroup_path_, ec);
    if (ec) {
        spdlog::warn("DEGRADED ISOLATION: cannot create cgroup {}: {}", cgroup_path_, ec.message());
        add_degraded("cannot create cgroup (need delegation or root)");
        return false;
    }
    cgroup_created_ = true;

    if (write_file(cgroup_path_ + "/memory.max", std::to_string(config_.limits.memory_bytes))) {
        status_.memory_limit_applied = true;
        // Swap would let the runtime dodge the memory limit
        write_file(cgroup_path_ + "/memory.swap.max", "0");
    } else {
        spdlog::warn("DEGRADED ISOLATION: memory.max not writable - memory limit NOT enforced");
        add_degraded("memory limit not applied");
    }

    if (write_file(cgroup_path_ + "/pids.max", std::to_string(config_.limits.max_pids))) {
        status_.pids_limit_applied = true;
    } else {
        spdlog::warn("DEGRADED ISOLATION: pids.max not writable - pid limit NOT enforced");
        add_degraded("pid limit not applied");
    }
    return true;
}

bool Sandbox::assign_cgroup(pid_t pid) {
    if (write_file(cgroup_path_ + "/cgroup.procs", std::to_string(pid))) {
        status_.cgroup_assigned = true;
        spdlog::debug("Added PID {} to cgroup {}", pid, cgroup_path_);
        return true;
    }
    spdlog::warn("DEGRADED ISOLATION: process {} not added to cgroup - resource limits NOT enforced", pid);
    add_degraded("process not assigned to cgroup");
    status_.memory_limit_applied = false;
    status_.pids_limit_applied = false;
    return false;
}

// Maps the orchestrator's own uid/gid into the new user namespace
bool Sandbox::write_id_maps(pid_t pid) {
    std::string proc = "/proc/" + std::to_string(pid);
    uid_t uid = getuid();
    gid_t gid = getgid();
    if (!write_file(proc + "/setgroups", "deny")) {
        return false;
    }
    if (!write_file(proc + "/uid_map", fmt::format("{} {} 1\n", uid, uid))) {
        return false;
    }
    return write_file(proc + "/gid_map", fmt::format("{} {} 1\n", gid, gid));
}

bool Sandbox::start(const std::vector<std::string>& argv,
                    const std::vector<std::string>& env,
                    const SandboxStdio& stdio,
                    std::string* error) {
    auto fail = [error](std::string msg) {
        spdlog::error("{}", msg);
        if (error) *error = std::move(msg);
        return false;
    };

    if (pid_ > 0) {
        return fail(fmt::format("sandbox {} already started", config_.name));
    }
    if (argv.empty()) {
        return fail("empty runtime command");
    }
    if (stdio.stdout_fd < 0 || stdio.stderr_fd < 0 || stdio.channel_fd < 0) {
        return fail("sandbox stdio descriptors not set");
    }

    bool want_namespaces = config_.isolation_requested && config_.enable_namespaces;
    bool want_cgroups = config_.isolation_requested && config_.enable_cgroups;
    bool cgroup_ready = want_cgroups && setup_cgroup();

    std::vector<std::string> argv_storage = argv;
    std::vector<std::string> env_storage = env;
    ChildArgs child;
    for (auto& a : argv_storage) child.argv.push_back(a.data());
    child.argv.push_back(nullptr);
    for (auto& e : env_storage) child.envp.push_back(e.data());
    child.envp.push_back(nullptr);
    child.workdir = config_.workdir.empty() ? nullptr : config_.workdir.c_str();
    child.stdio = stdio;
    child.limits = config_.limits;

    auto open_sync = [&child]() {
        return pipe2(child.sync_fd, O_CLOEXEC) == 0;
    };

    pid_t pid = -1;
    if (want_namespaces) {
        if (!open_sync()) {
            return fail(fmt::format("pipe2 failed: {}", strerror(errno)));
        }
        std::vector<char> stack(STACK_SIZE);
        int flags = CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNET | SIGCHLD;
        pid = clone(child_entry, stack.data() + stack.size(), flags, &child);

        if (pid > 0 && !write_id_maps(pid)) {
            spdlog::warn("DEGRADED ISOLATION: cannot write id maps for user namespace");
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            pid = -1;
            errno = EPERM;
        }

        if (pid < 0) {
            spdlog::warn("DEGRADED ISOLATION: clone() failed ({}), falling back to fork()", strerror(errno));
            spdlog::warn("  -> Namespace isolation (USER, PID, NET) will NOT be available");
            add_degraded("namespaces unavailable");
            close(child.sync_fd[0]);
            close(child.sync_fd[1]);
        } else {
            status_.user_namespace = true;
            status_.pid_namespace = true;
            status_.net_namespace = true;
        }
    }

    if (pid < 0) {
        if (!open_sync()) {
            return fail(fmt::format("pipe2 failed: {}", strerror(errno)));
        }
        pid = fork();
        if (pid < 0) {
            int err = errno;
            close(child.sync_fd[0]);
            close(child.sync_fd[1]);
            return fail(fmt::format("fork() failed: {}", strerror(err)));
        }
        if (pid == 0) {
            _exit(child_entry(&child));
        }
    }

    pid_ = pid;
    close(child.sync_fd[0]);
    setpgid(pid_, pid_);

    if (cgroup_ready) {
        assign_cgroup(pid_);
    }
    status_.rlimits_applied = true;

    ssize_t w;
    do {
        w = write(child.sync_fd[1], "x", 1);
    } while (w < 0 && errno == EINTR);
    close(child.sync_fd[1]);
    if (w != 1) {
        kill_all();
        wait();
        return fail(fmt::format("cannot release sandbox child: {}", strerror(errno)));
    }

    if (!config_.isolation_requested) {
        status_.fully_isolated = false;
        spdlog::info("Sandbox {} started without OS isolation (PID={})", config_.name, pid_);
        return true;
    }

    bool namespaces_ok = !config_.enable_namespaces ||
                         (status_.user_namespace && status_.pid_namespace && status_.net_namespace);
    bool cgroups_ok = !config_.enable_cgroups ||
                      (status_.cgroup_assigned && status_.memory_limit_applied &&
                       status_.pids_limit_applied);
    status_.fully_isolated = namespaces_ok && cgroups_ok && status_.rlimits_applied;

    if (status_.fully_isolated) {
        spdlog::debug("Sandbox {} started with FULL isolation (PID={})", config_.name, pid_);
    } else {
        spdlog::warn("Sandbox {} started with PARTIAL isolation (PID={})", config_.name, pid_);
        spdlog::warn("  Namespaces: user={}, pid={}, net={}",
            status_.user_namespace ? "ON" : "OFF",
            status_.pid_namespace ? "ON" : "OFF",
            status_.net_namespace ? "ON" : "OFF");
        spdlog::warn("  Cgroup: assigned={}, memory={}, pids={}",
            status_.cgroup_assigned ? "ON" : "OFF",
            status_.memory_limit_applied ? "ON" : "OFF",
            status_.pids_limit_applied ? "ON" : "OFF");
    }
    return true;
}

void Sandbox::kill_all() {
    if (pid_ <= 0 || exited_) {
        return;
    }
    if (status_.cgroup_assigned) {
        write_file(cgroup_path_ + "/cgroup.kill", "1");
    }
    kill(-pid_, SIGKILL);
    kill(pid_, SIGKILL);
}

void Sandbox::record_status(int status) {
    exited_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        term_signal_ = WTERMSIG(status);
    }
}

bool Sandbox::poll_exit() {
    if (pid_ <= 0 || exited_) {
        return exited_;
    }
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        record_status(status);
    } else if (r < 0 && errno == ECHILD) {
        exited_ = true;
    }
    return exited_;
}

void Sandbox::wait() {
    if (pid_ <= 0 || exited_) {
        return;
    }
    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
        record_status(status);
    } else {
        exited_ = true;
    }
    // Orphans in the process group outlive a non-namespaced leader
    if (!status_.pid_namespace) {
        kill(-pid_, SIGKILL);
    }
}

bool Sandbox::oom_killed() const {
    if (!status_.cgroup_assigned) {
        return false;
    }
    std::ifstream ifs(cgroup_path_ + "/memory.events");
    std::string key;
    uint64_t value = 0;
    while (ifs >> key >> value) {
        if (key == "oom_kill" && value > 0) {
            return true;
        }
    }
    return false;
}

void Sandbox::cleanup() {
    if (!cgroup_created_) {
        return;
    }
    // rmdir fails with EBUSY until the kernel has drained the cgroup
    for (int attempt = 0; attempt < 20; ++attempt) {
        std::error_code ec;
        fs::remove(cgroup_path_, ec);
        if (!ec || !fs::exists(cgroup_path_)) {
            cgroup_created_ = false;
            spdlog::debug("Cleaned up cgroup: {}", cgroup_path_);
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    spdlog::warn("Failed to remove cgroup {}", cgroup_path_);
    cgroup_created_ = false;
}

} // namespace mcpguard::runtime
