#pragma once

#include <nlohmann/json.hpp>
#include <string>

enum class ReadStatus { Message, Incomplete, Closed };

class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    // Message: `cmd` holds one request. Incomplete: wait for more data.
    // Closed: peer hung up or sent garbage, the caller should close_client().
    virtual ReadStatus read_command(int client_fd, nlohmann::json& cmd) = 0;
    // Also used to push events to attached listeners. Whole lines only: what
    // the socket does not take at once is queued for flush().
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
