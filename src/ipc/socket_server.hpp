/**
 * mcpguard control socket server
 *
 * Unix domain socket server speaking the framed control protocol. A single
 * poll loop owns every client; handlers may answer inline or later from
 * any thread through post_response(), which wakes the loop via an eventfd.
 */
#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <functional>
#include <optional>
#include <cstdint>
#include "ipc/protocol.hpp"

namespace mcpguard::ipc {

using ClientId = uint64_t;

// Return a response to answer inline, nullopt to answer later
using MessageHandler = std::function<std::optional<Message>(ClientId client, const Message& msg)>;

struct ClientConnection {
    int fd;
    ClientId id;
    std::vector<uint8_t> recv_buffer;
    std::vector<uint8_t> send_buffer;
    bool want_write = false;

    ClientConnection(int f, ClientId i) : fd(f), id(i) {}
};

class SocketServer {
public:
    explicit SocketServer(const std::string& socket_path);
    ~SocketServer();

    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    bool init();
    void set_handler(MessageHandler handler);

    // Serves until request_stop()
    void run();

    // Thread-safe; pending responses are flushed best-effort before run() returns
    void request_stop();

    // Thread-safe; false if the server is stopped
    bool post_response(ClientId client, Message response);

    void stop();

    const std::string& socket_path() const { return socket_path_; }
    size_t client_count() const;

private:
    void accept_connections();
    bool handle_client(ClientConnection& client);
    bool process_messages(ClientConnection& client);
    bool flush_client(ClientConnection& client);
    void queue_response(ClientConnection& client, const Message& response);
    void drain_posted();
    void remove_client(int fd);

    std::string socket_path_;
    int server_fd_ = -1;
    int wake_fd_ = -1;
    ClientId next_client_id_ = 1;
    MessageHandler handler_;

    std::map<int, std::unique_ptr<ClientConnection>> clients_;
    mutable std::mutex clients_mutex_;     // guards clients_ size for client_count()

    std::mutex posted_mutex_;
    std::vector<std::pair<ClientId, Message>> posted_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace mcpguard::ipc
