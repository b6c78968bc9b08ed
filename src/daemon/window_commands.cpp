#include "window_commands.hpp"

#include "titlebar_theme.hpp"

#include <print>

WindowCommands::WindowCommands(WindowManager& host, TitleBarPainter& painter,
                               Config::Window geometry, bool verbose)
    : host_(host), painter_(painter), geometry_(geometry), verbose_(verbose) {}

std::expected<void, std::string> WindowCommands::set_titlebar_theme(bool is_dark) {
    uint32_t color = titlebar_color(is_dark);
    titlebar_color_ = color;

    auto open = host_.windows();
    if (!open) {
        log("Title bar theme not applied: " + open.error());
        return {};
    }
    for (auto& window : *open) {
        painter_.paint(*window, color);
    }

    log(std::string("Title bar theme updated to ") + (is_dark ? "dark" : "light"));
    return {};
}

WindowSpec WindowCommands::session_window_spec(const CreateSessionWindowParams& params) const {
    WindowSpec spec;
    spec.label = session_window_label(params.tab_id);
    spec.url = build_session_url(params);
    spec.title = params.title;
    spec.width = geometry_.width;
    spec.height = geometry_.height;
    spec.min_width = geometry_.min_width;
    spec.min_height = geometry_.min_height;
    spec.resizable = true;
    spec.maximizable = true;
    spec.minimizable = true;
    spec.visible = true;
    spec.decorations = false; // the front-end draws its own title bar
    spec.center = true;
    return spec;
}

std::expected<WindowCreationResult, std::string>
WindowCommands::create_session_window(const CreateSessionWindowParams& params) {
    auto label = session_window_label(params.tab_id);

    auto existing = host_.get_window(label);
    if (!existing) return std::unexpected("Failed to create window: " + existing.error());
    if (*existing) {
        auto res = (*existing)->set_focus();
        if (!res) return std::unexpected("Failed to focus window: " + res.error());
        return WindowCreationResult{.window_label = label, .success = true};
    }

    auto spec = session_window_spec(params);
    log("Creating session window: " + label + " with URL: " + spec.url);

    auto created = host_.create_window(spec);
    if (!created) return std::unexpected("Failed to create window: " + created.error());

    if (!*created) {
        log("Waiting for " + label + " to map");
        return WindowCreationResult{.window_label = label, .success = false, .pending = true};
    }
    return present_new_window(**created);
}

std::expected<WindowCreationResult, std::string>
WindowCommands::finish_session_window(const std::string& window_label) {
    auto window = host_.get_window(window_label);
    if (!window) return std::unexpected("Failed to create window: " + window.error());
    if (!*window) {
        return std::unexpected("Failed to create window: " + window_label +
                               " closed before it could be shown");
    }
    return present_new_window(**window);
}

std::expected<WindowCreationResult, std::string>
WindowCommands::present_new_window(HostWindow& window) {
    if (titlebar_color_) {
        painter_.paint(window, *titlebar_color_);
    }

    auto focused = window.set_focus();
    if (!focused) return std::unexpected("Failed to focus new window: " + focused.error());

    log("Session window created successfully: " + window.label());
    return WindowCreationResult{.window_label = window.label(), .success = true};
}

std::expected<void, std::string> WindowCommands::close_session_window(const std::string& window_label) {
    auto window = host_.get_window(window_label);
    if (!window) return std::unexpected("Failed to close window: " + window.error());
    if (!*window) return std::unexpected("Window not found: " + window_label);

    auto res = (*window)->close();
    if (!res) return std::unexpected("Failed to close window: " + res.error());

    log("Session window closed: " + window_label);
    return {};
}

std::expected<std::vector<std::string>, std::string> WindowCommands::list_session_windows() {
    auto open = host_.windows();
    if (!open) return std::unexpected("Failed to list windows: " + open.error());

    std::vector<std::string> labels;
    for (auto& window : *open) {
        if (is_session_window_label(window->label())) {
            labels.push_back(window->label());
        }
    }
    return labels;
}

std::expected<void, std::string> WindowCommands::focus_session_window(const std::string& window_label) {
    auto window = host_.get_window(window_label);
    if (!window) return std::unexpected("Failed to focus window: " + window.error());
    if (!*window) return std::unexpected("Window not found: " + window_label);

    auto res = (*window)->set_focus();
    if (!res) return std::unexpected("Failed to focus window: " + res.error());
    return {};
}

std::expected<void, std::string> WindowCommands::emit_to_window(const std::string& window_label,
                                                                const std::string& event_name,
                                                                const std::string& payload) {
    auto window = host_.get_window(window_label);
    if (!window) return std::unexpected("Failed to emit event: " + window.error());
    if (!*window) return std::unexpected("Window not found: " + window_label);

    auto res = (*window)->emit(event_name, payload);
    if (!res) return std::unexpected("Failed to emit event: " + res.error());
    return {};
}

std::expected<uint32_t, std::string>
WindowCommands::broadcast_to_session_windows(const std::string& event_name,
                                             const std::string& payload) {
    auto open = host_.windows();
    if (!open) return std::unexpected("Failed to emit event: " + open.error());

    uint32_t count = 0;
    for (auto& window : *open) {
        if (!is_session_window_label(window->label())) continue;
        if (window->emit(event_name, payload)) ++count;
    }
    return count;
}

void WindowCommands::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[tabdock] [Window] {}", msg);
    }
}
