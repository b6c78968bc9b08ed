#pragma once

#include "config.hpp"
#include "platform/titlebar_painter.hpp"
#include "platform/window_manager.hpp"
#include "session_window.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

// The window command surface. Every call queries the host window manager
// live; nothing here caches window existence or focus.
class WindowCommands {
public:
    WindowCommands(WindowManager& host, TitleBarPainter& painter,
                   Config::Window geometry, bool verbose = false);

    WindowCommands(const WindowCommands&) = delete;
    WindowCommands& operator=(const WindowCommands&) = delete;

    // Applies the theme's caption color to every open window. Best-effort.
    std::expected<void, std::string> set_titlebar_theme(bool is_dark);

    // Focuses the window if one already exists for this tab. When the host
    // maps new windows asynchronously the result comes back with `pending`
    // set and finish_session_window completes it.
    std::expected<WindowCreationResult, std::string>
    create_session_window(const CreateSessionWindowParams& params);

    // Paints and focuses a window the host reported as mapped.
    std::expected<WindowCreationResult, std::string>
    finish_session_window(const std::string& window_label);

    std::expected<void, std::string> close_session_window(const std::string& window_label);
    std::expected<std::vector<std::string>, std::string> list_session_windows();
    std::expected<void, std::string> focus_session_window(const std::string& window_label);

    std::expected<void, std::string> emit_to_window(const std::string& window_label,
                                                    const std::string& event_name,
                                                    const std::string& payload);

    // Returns how many session windows accepted the event.
    std::expected<uint32_t, std::string> broadcast_to_session_windows(const std::string& event_name,
                                                                      const std::string& payload);

    // Color applied by the last set_titlebar_theme, if any.
    std::optional<uint32_t> current_titlebar_color() const { return titlebar_color_; }

    WindowSpec session_window_spec(const CreateSessionWindowParams& params) const;

private:
    std::expected<WindowCreationResult, std::string> present_new_window(HostWindow& window);
    void log(const std::string& msg);

    WindowManager& host_;
    TitleBarPainter& painter_;
    Config::Window geometry_;
    bool verbose_;

    std::optional<uint32_t> titlebar_color_;
};
