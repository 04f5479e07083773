#include "bridge/stdio_tool_server.hpp"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcpguard::bridge {

using json = nlohmann::json;

namespace {

constexpr size_t MAX_LINE_BYTES = 16 * 1024 * 1024;
constexpr int MAX_LIST_PAGES = 100;
constexpr int JSONRPC_METHOD_NOT_FOUND = -32601;

std::string describe_rpc_error(const json& err) {
    if (!err.is_object()) {
        return err.dump();
    }
    return "JSON-RPC error " + std::to_string(err.value("code", 0)) + ": " +
           err.value("message", std::string("unknown error"));
}

// Text parts of an MCP content array, newline-joined
std::string content_text(const json& result) {
    std::string out;
    if (!result.contains("content") || !result["content"].is_array()) {
        return out;
    }
    for (const auto& part : result["content"]) {
        if (part.is_object() && part.value("type", "") == "text" &&
            part.contains("text") && part["text"].is_string()) {
            if (!out.empty()) out += "\n";
            out += part["text"].get<std::string>();
        }
    }
    return out;
}

} // anonymous namespace

StdioToolServer::StdioToolServer(std::string name, ToolServerConfig config, int request_timeout_ms)
    : name_(std::move(name)),
      config_(std::move(config)),
      request_timeout_ms_(request_timeout_ms) {}

StdioToolServer::~StdioToolServer() {
    stop();
}

// ============================================================================
// Process management
// ============================================================================

bool StdioToolServer::spawn(std::string* error) {
    int stdin_pipe[2];
    int stdout_pipe[2];

    if (pipe2(stdin_pipe, O_CLOEXEC) == -1) {
        if (error) *error = std::string("pipe2 failed: ") + strerror(errno);
        return false;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
        if (error) *error = std::string("pipe2 failed: ") + strerror(errno);
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        return false;
    }

    // Everything the child touches is prepared before fork()
    std::vector<std::string> env_storage;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        std::string key = entry.substr(0, entry.find('='));
        if (!config_.env.count(key)) {
            env_storage.push_back(std::move(entry));
        }
    }
    for (const auto& [key, value] : config_.env) {
        env_storage.push_back(key + "=" + value);
    }

    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::vector<std::string> argv_storage;
    argv_storage.push_back(config_.command);
    argv_storage.insert(argv_storage.end(), config_.args.begin(), config_.args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        if (error) *error = std::string("fork failed: ") + strerror(errno);
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Own process group so stop() reaches helpers the server spawns
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        sigset_t unblocked;
        sigemptyset(&unblocked);
        sigprocmask(SIG_SETMASK, &unblocked, nullptr);
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        execvpe(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    close(stdin_pipe[0]);
    close(stdout_pipe[1]);

    pid_ = pid;
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    read_buffer_.clear();
    alive_ = true;

    spdlog::info("Tool server {} started (pid={})", name_, pid_);
    return true;
}

bool StdioToolServer::start(std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_ && alive_) {
        return true;
    }
    stop_locked();

    if (!spawn(error)) {
        return false;
    }

    json params = {
        {"protocolVersion", MCP_PROTOCOL_VERSION},
        {"capabilities", json::object()},
        {"clientInfo", {{"name", MCP_CLIENT_NAME}, {"version", MCP_CLIENT_VERSION}}}
    };

    auto result = request_locked("initialize", params, error);
    if (!result) {
        spdlog::error("Tool server {} failed to initialize: {}", name_, error ? *error : "");
        stop_locked();
        return false;
    }
    server_info_ = result->value("serverInfo", json::object());

    if (!notify_locked("notifications/initialized", json::object())) {
        if (error) *error = "failed to send initialized notification";
        stop_locked();
        return false;
    }

    initialized_ = true;
    spdlog::debug("Tool server {} initialized (protocol={})", name_,
                  result->value("protocolVersion", std::string("?")));
    return true;
}

void StdioToolServer::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_locked();
}

void StdioToolServer::stop_locked() {
    alive_ = false;
    initialized_ = false;

    if (stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }

    if (pid_ > 0) {
        // Closing stdin is the MCP shutdown signal; give it a moment
        int status;
        pid_t reaped = 0;
        for (int i = 0; i < 20 && reaped == 0; ++i) {
            reaped = waitpid(pid_, &status, WNOHANG);
            if (reaped == 0) usleep(10 * 1000);
        }
        if (reaped == 0) {
            kill(-pid_, SIGTERM);
            kill(pid_, SIGTERM);
            for (int i = 0; i < 50 && reaped == 0; ++i) {
                reaped = waitpid(pid_, &status, WNOHANG);
                if (reaped == 0) usleep(10 * 1000);
            }
        }
        if (reaped == 0) {
            kill(-pid_, SIGKILL);
            kill(pid_, SIGKILL);
            waitpid(pid_, &status, 0);
        }
        spdlog::debug("Tool server {} terminated (pid={})", name_, pid_);
        pid_ = -1;
    }
}

// ============================================================================
// Line transport
// ============================================================================

bool StdioToolServer::write_line(const std::string& line) {
    if (stdin_fd_ < 0) {
        return false;
    }
    std::string data = line + "\n";
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("Tool server {} write failed: {}", name_, strerror(errno));
            alive_ = false;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

std::optional<std::string> StdioToolServer::read_line(int timeout_ms, std::string* error) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    for (;;) {
        size_t nl = read_buffer_.find('\n');
        if (nl != std::string::npos) {
            std::string line = read_buffer_.substr(0, nl);
            read_buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
        if (read_buffer_.size() > MAX_LINE_BYTES) {
            if (error) *error = "response line exceeds size limit";
            alive_ = false;
            return std::nullopt;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            if (error) *error = "timed out after " + std::to_string(timeout_ms) + "ms";
            return std::nullopt;
        }

        struct pollfd pfd;
        pfd.fd = stdout_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = poll(&pfd, 1, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            if (error) *error = std::string("poll failed: ") + strerror(errno);
            return std::nullopt;
        }
        if (rc == 0) {
            continue;
        }

        char buf[8192];
        ssize_t n = read(stdout_fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            if (error) *error = std::string("read failed: ") + strerror(errno);
            alive_ = false;
            return std::nullopt;
        }
        if (n == 0) {
            if (error) *error = "tool server closed its output";
            alive_ = false;
            return std::nullopt;
        }
        read_buffer_.append(buf, static_cast<size_t>(n));
    }
}

// ============================================================================
// JSON-RPC
// ============================================================================

bool StdioToolServer::notify_locked(const std::string& method, const json& params) {
    json msg = {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
    return write_line(core::dump_json(msg));
}

std::optional<json> StdioToolServer::request_locked(const std::string& method,
                                                    const json& params,
                                                    std::string* error) {
    if (!alive_ || stdin_fd_ < 0) {
        if (error) *error = "tool server is not running";
        return std::nullopt;
    }

    int64_t id = next_id_++;
    json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    if (!write_line(core::dump_json(msg))) {
        if (error) *error = "failed to write " + method + " request";
        return std::nullopt;
    }

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(request_timeout_ms_);

    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            if (error) *error = method + " timed out after " +
                                std::to_string(request_timeout_ms_) + "ms";
            return std::nullopt;
        }

        std::string read_error;
        auto line = read_line(static_cast<int>(remaining), &read_error);
        if (!line) {
            if (error) *error = method + ": " + read_error;
            return std::nullopt;
        }
        if (line->empty()) {
            continue;
        }

        json reply;
        try {
            reply = json::parse(*line);
        } catch (const json::parse_error&) {
            spdlog::debug("Tool server {} wrote non-JSON line, ignoring", name_);
            continue;
        }
        if (!reply.is_object()) {
            continue;
        }

        // Server-initiated request: answer ping, refuse anything else
        if (reply.contains("method") && reply.contains("id")) {
            json answer = {{"jsonrpc", "2.0"}, {"id", reply["id"]}};
            if (reply["method"] == "ping") {
                answer["result"] = json::object();
            } else {
                answer["error"] = {{"code", JSONRPC_METHOD_NOT_FOUND},
                                   {"message", "method not supported by client"}};
            }
            if (!write_line(answer.dump())) {
                if (error) *error = "failed to answer server request";
                return std::nullopt;
            }
            continue;
        }

        // Notifications and stale responses
        if (!reply.contains("id") || reply["id"] != id) {
            continue;
        }

        if (reply.contains("error")) {
            if (error) *error = describe_rpc_error(reply["error"]);
            return std::nullopt;
        }
        if (!reply.contains("result")) {
            if (error) *error = method + " response has neither result nor error";
            return std::nullopt;
        }
        return reply["result"];
    }
}

// ============================================================================
// ToolServerConnection
// ============================================================================

std::optional<std::vector<core::ToolDescriptor>> StdioToolServer::list_tools(std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        if (error) *error = "tool server '" + name_ + "' is not initialized";
        return std::nullopt;
    }

    std::vector<core::ToolDescriptor> tools;
    std::optional<std::string> cursor;

    for (int page = 0; page < MAX_LIST_PAGES; ++page) {
        json params = json::object();
        if (cursor) {
            params["cursor"] = *cursor;
        }

        auto result = request_locked("tools/list", params, error);
        if (!result) {
            return std::nullopt;
        }

        if (result->contains("tools") && (*result)["tools"].is_array()) {
            for (const auto& item : (*result)["tools"]) {
                auto tool = core::ToolDescriptor::from_json(item);
                if (!tool) {
                    spdlog::warn("Tool server {} listed a malformed tool, skipping", name_);
                    continue;
                }
                tools.push_back(std::move(*tool));
            }
        }

        if (result->contains("nextCursor") && (*result)["nextCursor"].is_string() &&
            !(*result)["nextCursor"].get<std::string>().empty()) {
            cursor = (*result)["nextCursor"].get<std::string>();
        } else {
            spdlog::debug("Tool server {} lists {} tools", name_, tools.size());
            return tools;
        }
    }

    spdlog::warn("Tool server {} tools/list pagination exceeded {} pages", name_, MAX_LIST_PAGES);
    return tools;
}

ToolCallOutcome StdioToolServer::call_tool(const std::string& name, const json& arguments) {
    std::lock_guard<std::mutex> lock(mutex_);
    ToolCallOutcome outcome;

    if (!initialized_) {
        outcome.error = "tool server '" + name_ + "' is not initialized";
        return outcome;
    }

    json params = {
        {"name", name},
        {"arguments", arguments.is_object() ? arguments : json::object()}
    };

    std::string error;
    auto result = request_locked("tools/call", params, &error);
    if (!result) {
        outcome.error = error;
        return outcome;
    }

    outcome.result = *result;
    if (result->is_object() && result->value("isError", false)) {
        outcome.ok = false;
        outcome.error = content_text(*result);
        if (outcome.error.empty()) {
            outcome.error = "tool '" + name + "' reported an error";
        }
        return outcome;
    }

    outcome.ok = true;
    return outcome;
}

} // namespace mcpguard::bridge
