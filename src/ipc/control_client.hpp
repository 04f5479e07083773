/**
 * mcpguard control client
 *
 * Blocking client for the control socket, used by the CLI subcommands.
 */
#pragma once
#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "ipc/protocol.hpp"

namespace mcpguard::ipc {

class ControlClient {
public:
    explicit ControlClient(std::string socket_path);
    ~ControlClient();

    ControlClient(const ControlClient&) = delete;
    ControlClient& operator=(const ControlClient&) = delete;

    bool connect(std::string* error = nullptr);
    void disconnect();
    bool connected() const { return fd_ >= 0; }

    // Sends one request and waits for the response with the same id.
    // timeout_ms <= 0 waits forever (SUBMIT answers when the run ends).
    std::optional<nlohmann::json> call(ControlOp op, const nlohmann::json& payload,
                                       int timeout_ms = 0, std::string* error = nullptr);

private:
    bool send_message(const Message& msg, std::string* error);
    std::optional<Message> read_message(int timeout_ms, std::string* error);

    std::string socket_path_;
    int fd_ = -1;
    uint32_t next_request_id_ = 1;
    std::vector<uint8_t> recv_buffer_;
};

} // namespace mcpguard::ipc
