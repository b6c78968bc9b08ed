#include "ipc.hpp"

#include "tree.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

SwayIpc::SwayIpc() = default;

SwayIpc::~SwayIpc() {
    if (query_fd_ >= 0) ::close(query_fd_);
    if (event_fd_ >= 0) ::close(event_fd_);
}

bool SwayIpc::connect(const std::string& path) {
    if (path.empty()) {
        const char* sock = std::getenv("SWAYSOCK");
        if (!sock) {
            std::println(stderr, "sway: $SWAYSOCK not set");
            return false;
        }
        sway_sock_ = sock;
    } else {
        sway_sock_ = path;
    }

    query_fd_ = connect_socket(sway_sock_);
    return query_fd_ >= 0;
}

std::expected<void, std::string> SwayIpc::run_command(const std::string& command) {
    auto reply = request(MSG_RUN_COMMAND, command);
    if (!reply) return std::unexpected(reply.error());
    return parse_command_reply(*reply);
}

std::expected<nlohmann::json, std::string> SwayIpc::get_tree() {
    auto reply = request(MSG_GET_TREE, "");
    if (!reply) return std::unexpected(reply.error());

    try {
        return nlohmann::json::parse(*reply);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string("malformed tree reply: ") + e.what());
    }
}

bool SwayIpc::subscribe(const std::string& events) {
    if (sway_sock_.empty()) return false;

    event_fd_ = connect_socket(sway_sock_);
    if (event_fd_ < 0) return false;

    if (!send_message(event_fd_, MSG_SUBSCRIBE, events)) {
        ::close(event_fd_);
        event_fd_ = -1;
        return false;
    }

    // Read subscribe response
    uint32_t type;
    std::string payload;
    if (!recv_message(event_fd_, type, payload)) {
        ::close(event_fd_);
        event_fd_ = -1;
        return false;
    }

    return true;
}

bool SwayIpc::read_event(uint32_t& type, nlohmann::json& payload) {
    if (event_fd_ < 0) return false;

    std::string raw;
    if (!recv_message(event_fd_, type, raw)) {
        // sway went away
        ::close(event_fd_);
        event_fd_ = -1;
        return false;
    }

    try {
        payload = nlohmann::json::parse(raw);
        return true;
    } catch (const nlohmann::json::exception&) {
        return false;
    }
}

std::expected<std::string, std::string> SwayIpc::request(uint32_t type, const std::string& payload) {
    if (query_fd_ < 0) return std::unexpected(std::string("not connected to sway"));

    if (!send_message(query_fd_, type, payload)) {
        return std::unexpected(std::string("send to sway failed: ") + std::strerror(errno));
    }

    uint32_t reply_type;
    std::string reply;
    if (!recv_message(query_fd_, reply_type, reply)) {
        return std::unexpected(std::string("no reply from sway"));
    }
    if (reply_type != type) {
        return std::unexpected(std::format("unexpected sway reply type {}", reply_type));
    }
    return reply;
}

int SwayIpc::connect_socket(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "sway: connect failed: {}", std::strerror(errno));
        ::close(fd);
        return -1;
    }
    return fd;
}

bool SwayIpc::send_message(int fd, uint32_t type, const std::string& payload) {
    // Header: "i3-ipc" (6 bytes) + length (4 bytes) + type (4 bytes)
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[14];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(fd, header, 14, MSG_NOSIGNAL) != 14) return false;
    if (len > 0) {
        if (::send(fd, payload.data(), len, MSG_NOSIGNAL) != static_cast<ssize_t>(len))
            return false;
    }
    return true;
}

bool SwayIpc::recv_message(int fd, uint32_t& type, std::string& payload) {
    char header[14];
    size_t read_total = 0;
    while (read_total < 14) {
        ssize_t n = ::recv(fd, header + read_total, 14 - read_total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    if (std::memcmp(header, MAGIC, 6) != 0) return false;

    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type, header + 10, 4);

    payload.resize(len);
    read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(fd, payload.data() + read_total, len - read_total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    return true;
}
