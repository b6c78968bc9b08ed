#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

inline constexpr std::string_view kSessionWindowPrefix = "session-window-";

struct CreateSessionWindowParams {
    std::string tab_id;                       // unique per tab, used verbatim in the label
    std::optional<std::string> session_id;
    std::optional<std::string> project_path;
    std::string title;
    std::optional<std::string> engine;        // "claude" | "codex", not validated

    static std::expected<CreateSessionWindowParams, std::string> from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct WindowCreationResult {
    std::string window_label;
    bool success = false;
    // The host is still mapping the window; not part of the wire format.
    bool pending = false;

    nlohmann::json to_json() const;
};

std::string session_window_label(const std::string& tab_id);
bool is_session_window_label(std::string_view label);

// Percent-encodes everything outside A-Z a-z 0-9 - _ . ~
std::string url_encode(std::string_view text);

// "/?window=session&tab_id=..[&session_id=..][&project_path=..][&engine=..]"
std::string build_session_url(const CreateSessionWindowParams& params);
