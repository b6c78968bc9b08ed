#pragma once

#include "platform/ipc_server.hpp"

#include <set>
#include <utility>
#include <vector>

// Records what would have been written to each client.
class FakeIpcServer : public IpcServer {
public:
    bool start(const std::string& /*endpoint*/) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    ReadStatus read_command(int /*client_fd*/, nlohmann::json& /*cmd*/) override {
        return ReadStatus::Incomplete;
    }

    bool send_response(int client_fd, const nlohmann::json& response) override {
        if (broken.contains(client_fd)) return false;
        sent.emplace_back(client_fd, response);
        return true;
    }

    void close_client(int /*client_fd*/) override {}

    std::vector<std::pair<int, nlohmann::json>> sent;
    std::set<int> broken;
};
