#include "ipc/socket_server.hpp"
#include <spdlog/spdlog.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace mcpguard::ipc {

SocketServer::SocketServer(const std::string& socket_path)
    : socket_path_(socket_path) {}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::init() {
    struct sockaddr_un addr;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        spdlog::error("Socket path too long: {}", socket_path_);
        return false;
    }

    // Remove existing socket file
    unlink(socket_path_.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
    if (server_fd_ < 0) {
        spdlog::error("Failed to create socket: {}", strerror(errno));
        return false;
    }

    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("Failed to bind socket: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // Owner only: the socket accepts arbitrary scripts
    if (chmod(socket_path_.c_str(), 0600) < 0) {
        spdlog::warn("Failed to restrict socket permissions: {}", strerror(errno));
    }

    if (listen(server_fd_, 16) < 0) {
        spdlog::error("Failed to listen: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    wake_fd_ = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (wake_fd_ < 0) {
        spdlog::error("Failed to create eventfd: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    running_ = true;
    spdlog::info("Control server listening on {}", socket_path_);
    return true;
}

void SocketServer::set_handler(MessageHandler handler) {
    handler_ = std::move(handler);
}

size_t SocketServer::client_count() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

// ============================================================================
// Poll loop
// ============================================================================

void SocketServer::run() {
    while (running_ && !stop_requested_) {
        std::vector<struct pollfd> fds;
        fds.push_back({server_fd_, POLLIN, 0});
        fds.push_back({wake_fd_, POLLIN, 0});
        for (const auto& [fd, client] : clients_) {
            short events = POLLIN;
            if (client->want_write) events |= POLLOUT;
            fds.push_back({fd, events, 0});
        }

        int rc = poll(fds.data(), fds.size(), 1000);
        if (rc < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll failed: {}", strerror(errno));
            break;
        }

        if (fds[1].revents & POLLIN) {
            uint64_t value;
            while (read(wake_fd_, &value, sizeof(value)) > 0) {}
        }
        drain_posted();

        std::vector<int> dead;
        for (size_t i = 2; i < fds.size(); ++i) {
            auto it = clients_.find(fds[i].fd);
            if (it == clients_.end()) continue;
            ClientConnection& client = *it->second;

            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                if (!handle_client(client)) {
                    dead.push_back(client.fd);
                    continue;
                }
            }
            if (client.want_write && !flush_client(client)) {
                dead.push_back(client.fd);
            }
        }
        for (int fd : dead) {
            remove_client(fd);
        }

        if (fds[0].revents & POLLIN) {
            accept_connections();
        }
    }

    // Last chance for responses posted during shutdown
    drain_posted();
    for (auto& [fd, client] : clients_) {
        flush_client(*client);
    }
}

void SocketServer::request_stop() {
    stop_requested_ = true;
    if (wake_fd_ >= 0) {
        uint64_t one = 1;
        ssize_t ignored = write(wake_fd_, &one, sizeof(one));
        (void)ignored;
    }
}

bool SocketServer::post_response(ClientId client, Message response) {
    if (!running_) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(posted_mutex_);
        posted_.emplace_back(client, std::move(response));
    }
    uint64_t one = 1;
    ssize_t ignored = write(wake_fd_, &one, sizeof(one));
    (void)ignored;
    return true;
}

void SocketServer::drain_posted() {
    std::vector<std::pair<ClientId, Message>> posted;
    {
        std::lock_guard<std::mutex> lock(posted_mutex_);
        posted.swap(posted_);
    }
    for (auto& [client_id, response] : posted) {
        bool delivered = false;
        for (auto& [fd, client] : clients_) {
            if (client->id == client_id) {
                queue_response(*client, response);
                delivered = true;
                break;
            }
        }
        if (!delivered) {
            spdlog::debug("Dropping {} response for departed client {}",
                          opcode_to_string(response.opcode), client_id);
        }
    }
}

// ============================================================================
// Clients
// ============================================================================

void SocketServer::accept_connections() {
    for (;;) {
        int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                spdlog::error("Failed to accept: {}", strerror(errno));
            }
            return;
        }

        ClientId id = next_client_id_++;
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            clients_[client_fd] = std::make_unique<ClientConnection>(client_fd, id);
        }
        spdlog::debug("Client {} connected (fd={})", id, client_fd);
    }
}

bool SocketServer::handle_client(ClientConnection& client) {
    uint8_t buffer[16384];

    while (true) {
        ssize_t n = read(client.fd, buffer, sizeof(buffer));
        if (n > 0) {
            client.recv_buffer.insert(client.recv_buffer.end(), buffer, buffer + n);
        } else if (n == 0) {
            spdlog::debug("Client {} disconnected (fd={})", client.id, client.fd);
            return false;
        } else {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) continue;
            spdlog::error("Read error for client {}: {}", client.id, strerror(errno));
            return false;
        }
    }

    return process_messages(client);
}

bool SocketServer::process_messages(ClientConnection& client) {
    while (true) {
        const uint8_t* data = client.recv_buffer.data();
        size_t len = client.recv_buffer.size();

        if (!Message::header_valid(data, len)) {
            // No way to resynchronize a byte stream after a bad header
            spdlog::warn("Invalid header from client {}, disconnecting", client.id);
            return false;
        }

        auto msg_size = Message::get_message_size(data, len);
        if (!msg_size || len < *msg_size) {
            break;
        }

        auto msg = Message::deserialize(data, len);
        client.recv_buffer.erase(client.recv_buffer.begin(),
                                 client.recv_buffer.begin() + *msg_size);
        if (!msg) {
            continue;
        }

        spdlog::debug("Client {} -> {} #{} ({}B payload)",
            client.id, opcode_to_string(msg->opcode), msg->request_id, msg->payload.size());

        if (handler_) {
            std::optional<Message> response = handler_(client.id, *msg);
            if (response) {
                queue_response(client, *response);
            }
        }
    }
    return true;
}

void SocketServer::queue_response(ClientConnection& client, const Message& response) {
    auto serialized = response.serialize();
    client.send_buffer.insert(client.send_buffer.end(), serialized.begin(), serialized.end());
    client.want_write = true;

    spdlog::debug("Client {} <- {} #{} ({}B payload)",
        client.id, opcode_to_string(response.opcode), response.request_id,
        response.payload.size());
}

bool SocketServer::flush_client(ClientConnection& client) {
    while (!client.send_buffer.empty()) {
        ssize_t n = send(client.fd, client.send_buffer.data(), client.send_buffer.size(),
                         MSG_NOSIGNAL);
        if (n > 0) {
            client.send_buffer.erase(client.send_buffer.begin(),
                                     client.send_buffer.begin() + n);
        } else if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) continue;
            spdlog::error("Write error for client {}: {}", client.id, strerror(errno));
            return false;
        }
    }

    client.want_write = !client.send_buffer.empty();
    return true;
}

void SocketServer::remove_client(int fd) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    auto it = clients_.find(fd);
    if (it != clients_.end()) {
        close(fd);
        clients_.erase(it);
    }
}

void SocketServer::stop() {
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (auto& [fd, client] : clients_) {
            close(fd);
        }
        clients_.clear();
    }

    bool was_listening = server_fd_ >= 0;
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
    if (wake_fd_ >= 0) {
        close(wake_fd_);
        wake_fd_ = -1;
    }

    if (was_listening) {
        unlink(socket_path_.c_str());
        spdlog::info("Control server stopped");
    }
}

} // namespace mcpguard::ipc
