#include "ipc/control_client.hpp"
#include "core/types.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <chrono>

namespace mcpguard::ipc {

using json = nlohmann::json;

ControlClient::ControlClient(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

ControlClient::~ControlClient() {
    disconnect();
}

bool ControlClient::connect(std::string* error) {
    disconnect();

    struct sockaddr_un addr;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        if (error) *error = "socket path too long";
        return false;
    }

    fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        if (error) *error = fmt::format("socket failed: {}", strerror(errno));
        return false;
    }

    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        if (error) *error = fmt::format("cannot connect to {}: {}", socket_path_, strerror(errno));
        disconnect();
        return false;
    }
    return true;
}

void ControlClient::disconnect() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
    recv_buffer_.clear();
}

bool ControlClient::send_message(const Message& msg, std::string* error) {
    auto data = msg.serialize();
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n > 0) {
            off += static_cast<size_t>(n);
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            if (error) *error = fmt::format("send failed: {}", strerror(errno));
            return false;
        }
    }
    return true;
}

std::optional<Message> ControlClient::read_message(int timeout_ms, std::string* error) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    for (;;) {
        if (!Message::header_valid(recv_buffer_.data(), recv_buffer_.size())) {
            if (error) *error = "invalid response header";
            return std::nullopt;
        }
        auto size = Message::get_message_size(recv_buffer_.data(), recv_buffer_.size());
        if (size && recv_buffer_.size() >= *size) {
            auto msg = Message::deserialize(recv_buffer_.data(), recv_buffer_.size());
            recv_buffer_.erase(recv_buffer_.begin(), recv_buffer_.begin() + *size);
            return msg;
        }

        int wait = -1;
        if (timeout_ms > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                if (error) *error = "timed out waiting for response";
                return std::nullopt;
            }
            wait = static_cast<int>(remaining);
        }

        struct pollfd pfd = {fd_, POLLIN, 0};
        int rc = poll(&pfd, 1, wait);
        if (rc < 0) {
            if (errno == EINTR) continue;
            if (error) *error = fmt::format("poll failed: {}", strerror(errno));
            return std::nullopt;
        }
        if (rc == 0) continue;

        uint8_t buf[16384];
        ssize_t n = read(fd_, buf, sizeof(buf));
        if (n > 0) {
            recv_buffer_.insert(recv_buffer_.end(), buf, buf + n);
        } else if (n == 0) {
            if (error) *error = "server closed the connection";
            return std::nullopt;
        } else if (errno != EINTR && errno != EAGAIN) {
            if (error) *error = fmt::format("read failed: {}", strerror(errno));
            return std::nullopt;
        }
    }
}

std::optional<json> ControlClient::call(ControlOp op, const json& payload,
                                        int timeout_ms, std::string* error) {
    if (fd_ < 0 && !connect(error)) {
        return std::nullopt;
    }

    uint32_t id = next_request_id_++;
    if (!send_message(Message(id, op, core::dump_json(payload)), error)) {
        return std::nullopt;
    }

    for (;;) {
        auto msg = read_message(timeout_ms, error);
        if (!msg) {
            return std::nullopt;
        }
        if (msg->request_id != id) {
            spdlog::debug("Skipping response #{} while waiting for #{}", msg->request_id, id);
            continue;
        }
        try {
            return json::parse(msg->payload_str());
        } catch (const json::parse_error& e) {
            if (error) *error = fmt::format("malformed response: {}", e.what());
            return std::nullopt;
        }
    }
}

} // namespace mcpguard::ipc
