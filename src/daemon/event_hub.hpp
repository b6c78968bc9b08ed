#pragma once

#include "platform/ipc_server.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

// Routes window events to the front-end processes listening on a label.
// A front-end attaches by sending {"cmd":"attach","window_label":...} on its
// IPC connection; events are then pushed as JSON lines on that connection.
class EventHub {
public:
    explicit EventHub(IpcServer& ipc);

    EventHub(const EventHub&) = delete;
    EventHub& operator=(const EventHub&) = delete;

    void attach(const std::string& label, int client_fd);
    void detach_client(int client_fd);
    void drop_label(const std::string& label);

    // Succeeds when no listener is attached; fails only when every attached
    // listener's send failed.
    std::expected<void, std::string> deliver(const std::string& label,
                                             const std::string& event,
                                             const std::string& payload);

    size_t listener_count() const { return listeners_.size(); }
    bool has_listener(const std::string& label) const;

private:
    struct Listener {
        std::string label;
        int fd;
    };

    IpcServer& ipc_;
    std::vector<Listener> listeners_;
};
