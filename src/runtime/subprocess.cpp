#include "runtime/subprocess.hpp"
#include "runtime/cancellation.hpp"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcpguard::runtime {

namespace {

void set_rlimit(int resource, rlim_t value) {
    struct rlimit rl;
    rl.rlim_cur = value;
    rl.rlim_max = value;
    setrlimit(resource, &rl);
}

// Reads whatever is available; false on EOF or hard error
bool drain_fd(int fd, CappedBuffer& buffer) {
    char buf[8192];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            buffer.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        return false;
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

} // anonymous namespace

std::vector<std::string> expand_template(
    const std::vector<std::string>& argv_template,
    const std::vector<std::pair<std::string, std::string>>& values) {

    std::vector<std::string> out;
    out.reserve(argv_template.size());
    for (std::string arg : argv_template) {
        for (const auto& [key, value] : values) {
            std::string placeholder = "{" + key + "}";
            size_t pos = 0;
            while ((pos = arg.find(placeholder, pos)) != std::string::npos) {
                arg.replace(pos, placeholder.size(), value);
                pos += value.size();
            }
        }
        out.push_back(std::move(arg));
    }
    return out;
}

ProcessResult run_capture(const std::vector<std::string>& argv,
                          const std::string& cwd,
                          const ProcessLimits& limits,
                          const CancellationToken* cancel,
                          const std::vector<std::string>& env) {
    ProcessResult res;
    if (argv.empty()) {
        res.error = "empty command";
        return res;
    }

    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) < 0) {
        res.error = std::string("pipe2 failed: ") + strerror(errno);
        return res;
    }
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        res.error = std::string("pipe2 failed: ") + strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return res;
    }

    std::vector<std::string> argv_storage = argv;
    std::vector<char*> cargv;
    for (auto& arg : argv_storage) cargv.push_back(arg.data());
    cargv.push_back(nullptr);

    std::vector<std::string> env_storage = env;
    std::vector<char*> cenv;
    for (auto& entry : env_storage) cenv.push_back(entry.data());
    cenv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        res.error = std::string("fork failed: ") + strerror(errno);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return res;
    }

    if (pid == 0) {
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        sigset_t unblocked;
        sigemptyset(&unblocked);
        sigprocmask(SIG_SETMASK, &unblocked, nullptr);
        prctl(PR_SET_PDEATHSIG, SIGKILL);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        if (!cwd.empty() && chdir(cwd.c_str()) < 0) {
            _exit(126);
        }
        if (limits.rlimit_cpu_sec > 0) {
            set_rlimit(RLIMIT_CPU, static_cast<rlim_t>(limits.rlimit_cpu_sec));
        }
        if (limits.rlimit_fsize_mb > 0) {
            set_rlimit(RLIMIT_FSIZE, static_cast<rlim_t>(limits.rlimit_fsize_mb) * 1024 * 1024);
        }

        if (env.empty()) {
            execvp(cargv[0], cargv.data());
        } else {
            execvpe(cargv[0], cargv.data(), cenv.data());
        }
        _exit(127);
    }

    setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);
    res.started = true;

    CappedBuffer out(limits.max_output_bytes);
    CappedBuffer err(limits.max_output_bytes);
    bool out_open = true;
    bool err_open = true;
    int status = 0;
    bool reaped = false;

    auto start = std::chrono::steady_clock::now();
    auto deadline = start + std::chrono::milliseconds(limits.timeout_ms);

    while (!reaped) {
        if (cancel && cancel->is_cancelled()) {
            res.cancelled = true;
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (limits.timeout_ms > 0 && now >= deadline) {
            res.timed_out = true;
            break;
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        int out_idx = -1, err_idx = -1;
        if (out_open) { out_idx = nfds; fds[nfds++] = {out_pipe[0], POLLIN, 0}; }
        if (err_open) { err_idx = nfds; fds[nfds++] = {err_pipe[0], POLLIN, 0}; }
        if (cancel && cancel->wait_fd() >= 0) { fds[nfds++] = {cancel->wait_fd(), POLLIN, 0}; }

        int slice = 50;
        if (limits.timeout_ms > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            if (remaining < slice) slice = std::max<int>(1, static_cast<int>(remaining));
        }

        int rc = poll(fds, nfds, slice);
        if (rc < 0 && errno != EINTR) {
            res.error = std::string("poll failed: ") + strerror(errno);
            break;
        }

        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            out_open = drain_fd(out_pipe[0], out);
        }
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            err_open = drain_fd(err_pipe[0], err);
        }

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
        }
    }

    if (!reaped) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        if (res.timed_out) {
            spdlog::warn("Process {} timed out after {}ms, killed", argv[0], limits.timeout_ms);
        }
    } else {
        // Stray grandchildren may still hold the pipes
        kill(-pid, SIGKILL);
    }

    if (out_open) drain_fd(out_pipe[0], out);
    if (err_open) drain_fd(err_pipe[0], err);
    close(out_pipe[0]);
    close(err_pipe[0]);

    if (WIFEXITED(status)) {
        res.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.term_signal = WTERMSIG(status);
    }

    res.stdout_truncated = out.truncated();
    res.stderr_truncated = err.truncated();
    res.stdout_text = out.take();
    res.stderr_text = err.take();
    return res;
}

} // namespace mcpguard::runtime
