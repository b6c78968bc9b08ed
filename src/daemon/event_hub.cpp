#include "event_hub.hpp"

#include <algorithm>

EventHub::EventHub(IpcServer& ipc) : ipc_(ipc) {}

void EventHub::attach(const std::string& label, int client_fd) {
    bool known = std::ranges::any_of(listeners_, [&](const Listener& l) {
        return l.fd == client_fd && l.label == label;
    });
    if (!known) listeners_.push_back({label, client_fd});
}

void EventHub::detach_client(int client_fd) {
    std::erase_if(listeners_, [client_fd](const Listener& l) { return l.fd == client_fd; });
}

void EventHub::drop_label(const std::string& label) {
    std::erase_if(listeners_, [&label](const Listener& l) { return l.label == label; });
}

bool EventHub::has_listener(const std::string& label) const {
    return std::ranges::any_of(listeners_, [&label](const Listener& l) { return l.label == label; });
}

std::expected<void, std::string> EventHub::deliver(const std::string& label,
                                                   const std::string& event,
                                                   const std::string& payload) {
    nlohmann::json msg = {
        {"event", event},
        {"window_label", label},
        {"payload", payload},
    };

    // With nobody attached the event is dropped, like an event nobody listens for.
    size_t targets = 0;
    size_t delivered = 0;
    for (auto& l : listeners_) {
        if (l.label != label) continue;
        ++targets;
        if (ipc_.send_response(l.fd, msg)) ++delivered;
    }

    if (targets > 0 && delivered == 0) return std::unexpected(std::string("send failed"));
    return {};
}
