/**
 * mcpguard subprocess capture
 *
 * Runs a trusted helper (the build toolchain) to completion with separate
 * stdout/stderr capture, a wall-clock timeout and cancellation. The child
 * gets its own process group so the whole subtree can be killed.
 */
#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace mcpguard::runtime {

class CancellationToken;

// Byte buffer that stops growing at a cap and remembers that it did
class CappedBuffer {
public:
    explicit CappedBuffer(size_t cap) : cap_(cap) {}

    void append(const char* data, size_t len) {
        size_t room = cap_ > data_.size() ? cap_ - data_.size() : 0;
        if (len > room) {
            truncated_ = true;
            len = room;
        }
        data_.append(data, len);
    }

    const std::string& data() const { return data_; }
    std::string take() { return std::move(data_); }
    bool truncated() const { return truncated_; }

private:
    size_t cap_;
    std::string data_;
    bool truncated_ = false;
};

struct ProcessLimits {
    int timeout_ms = 30000;
    size_t max_output_bytes = 1024 * 1024;
    int rlimit_cpu_sec = 0;          // 0 = unlimited
    size_t rlimit_fsize_mb = 64;
};

struct ProcessResult {
    bool started = false;
    int exit_code = -1;              // valid when exited
    int term_signal = 0;             // non-zero when killed by a signal
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::string error;               // runner failure, not child stderr

    bool exited_cleanly() const {
        return started && !timed_out && !cancelled && term_signal == 0 && exit_code == 0;
    }
};

// argv[0] is looked up on PATH. env empty = inherit the orchestrator's.
ProcessResult run_capture(const std::vector<std::string>& argv,
                          const std::string& cwd,
                          const ProcessLimits& limits,
                          const CancellationToken* cancel = nullptr,
                          const std::vector<std::string>& env = {});

// Expands {key} placeholders in every argument
std::vector<std::string> expand_template(
    const std::vector<std::string>& argv_template,
    const std::vector<std::pair<std::string, std::string>>& values);

} // namespace mcpguard::runtime
