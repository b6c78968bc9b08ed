#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

struct SwayWindow {
    std::string app_id;   // Wayland app_id; the window label lives here
    std::string title;
    int pid = 0;
    bool focused = false;
};

// Flattens `nodes` and `floating_nodes` into leaf windows that carry an app_id.
std::vector<SwayWindow> collect_windows(const nlohmann::json& tree);

// Escapes `text` for use inside a quoted sway criteria regex.
std::string escape_criteria(std::string_view text);

// Criteria matching exactly one app_id: [app_id="^...$"]
std::string app_id_criteria(std::string_view app_id);

// RUN_COMMAND replies are [{"success": bool, "error": "..."}, ...].
std::expected<void, std::string> parse_command_reply(const std::string& payload);
