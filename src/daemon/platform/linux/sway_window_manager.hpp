#pragma once

#include "config.hpp"
#include "event_hub.hpp"
#include "platform/window_manager.hpp"
#include "sway/ipc.hpp"
#include "sway/tree.hpp"

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <vector>

// Host window manager on Sway. Each window is a front-end process started
// from the configured launcher with app_id = <app_id_prefix><label>; sway
// criteria on that app_id address it for focus and close. Events go to the
// front-end through the EventHub.
//
// With the window event subscription open, create_window returns at once and
// the mapping is finished from read_event; without it, create_window polls
// the tree until the window maps.
class SwayWindowManager : public WindowManager {
public:
    SwayWindowManager(const Config& config, EventHub& events, bool verbose = false);
    ~SwayWindowManager() override;

    SwayWindowManager(const SwayWindowManager&) = delete;
    SwayWindowManager& operator=(const SwayWindowManager&) = delete;

    bool connect() override;
    bool subscribe_window_events();

    std::expected<std::unique_ptr<HostWindow>, std::string>
    get_window(const std::string& label) override;
    std::expected<std::vector<std::unique_ptr<HostWindow>>, std::string> windows() override;
    std::expected<std::unique_ptr<HostWindow>, std::string>
    create_window(const WindowSpec& spec) override;

    int event_fd() const override { return ipc_.event_fd(); }
    bool read_event(WindowEvent& event) override;

    int poll_timeout_ms() const override;
    std::vector<WindowEvent> expire_pending() override;

    std::string app_id_for(const std::string& label) const;
    std::optional<std::string> label_for(const std::string& app_id) const;

    // Labels of this application's windows in tree order, each once.
    std::vector<std::string> labels_in(const nlohmann::json& tree) const;

    // Maps a sway window event payload to one of ours; nullopt for foreign
    // windows and changes we do not track.
    std::optional<WindowEvent> translate_event(const nlohmann::json& payload) const;

    // Geometry commands applied once the window has mapped.
    std::string placement_command(const WindowSpec& spec) const;

private:
    class Window;

    struct PendingMap {
        WindowSpec spec;
        std::chrono::steady_clock::time_point deadline;
    };

    std::expected<std::vector<std::string>, std::string> own_labels();
    std::expected<void, std::string> wait_for_map(const std::string& label);
    std::expected<void, std::string> place(const WindowSpec& spec);
    void log(const std::string& msg);

    Config::Frontend frontend_;
    uint32_t map_timeout_ms_;
    EventHub& events_;
    bool verbose_;
    SwayIpc ipc_;
    std::vector<PendingMap> pending_;
};
