#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace {
constexpr size_t kMaxLineBytes = 1 << 20;
// A listener this far behind is disconnected rather than buffered further.
constexpr size_t kMaxQueuedBytes = 4 << 20;
}

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    socket_path_ = endpoint;

    // Remove stale socket
    ::unlink(endpoint.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long");
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 16) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    return true;
}

void UnixSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back({fd, {}, {}});
    return fd;
}

ReadStatus UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto* client = find_client(client_fd);
    if (!client) return ReadStatus::Closed;

    // A previous recv may have delivered several lines at once.
    if (client->buf.find('\n') != std::string::npos) {
        return take_line(*client, cmd);
    }

    char buf[4096];
    ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
        return ReadStatus::Incomplete;
    }
    if (n <= 0) return ReadStatus::Closed;

    client->buf.append(buf, static_cast<size_t>(n));
    if (client->buf.size() > kMaxLineBytes && client->buf.find('\n') == std::string::npos) {
        std::println(stderr, "ipc: client {} exceeded {} bytes without a newline", client_fd,
                     kMaxLineBytes);
        return ReadStatus::Closed;
    }

    return take_line(*client, cmd);
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    std::string msg = response.dump() + "\n";
    if (client->out.size() + msg.size() > kMaxQueuedBytes) {
        std::println(stderr, "ipc: client {} is not reading, disconnecting", client_fd);
        client->out.clear();
        // The peer sees EOF after the lines already queued; our side reads
        // EOF too, so the event loop drops the client.
        ::shutdown(client_fd, SHUT_RDWR);
        return false;
    }

    client->out += msg;
    return flush(client_fd);
}

bool UnixSocketServer::flush(int client_fd) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    size_t total = 0;
    while (total < client->out.size()) {
        ssize_t sent = ::send(client_fd, client->out.data() + total, client->out.size() - total,
                              MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            client->out.clear();
            return false;
        }
        total += static_cast<size_t>(sent);
    }
    client->out.erase(0, total);
    return true;
}

bool UnixSocketServer::has_output(int client_fd) const {
    auto* client = find_client(client_fd);
    return client && !client->out.empty();
}

std::vector<int> UnixSocketServer::clients_with_output() const {
    std::vector<int> fds;
    for (auto& c : clients_) {
        if (!c.out.empty()) fds.push_back(c.fd);
    }
    return fds;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

bool UnixSocketServer::has_pending(int client_fd) const {
    auto* client = find_client(client_fd);
    return client && client->buf.find('\n') != std::string::npos;
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}

const UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) const {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}

ReadStatus UnixSocketServer::take_line(ClientBuffer& client, nlohmann::json& cmd) {
    auto pos = client.buf.find('\n');
    if (pos == std::string::npos) return ReadStatus::Incomplete;

    std::string line = client.buf.substr(0, pos);
    client.buf.erase(0, pos + 1);

    try {
        cmd = nlohmann::json::parse(line);
        return ReadStatus::Message;
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "ipc: malformed request from client {}: {}", client.fd, e.what());
        return ReadStatus::Closed;
    }
}
