#include "session_window.hpp"

#include <format>
#include <vector>

using json = nlohmann::json;

namespace {

std::optional<std::string> optional_string(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

} // namespace

std::expected<CreateSessionWindowParams, std::string>
CreateSessionWindowParams::from_json(const json& j) {
    if (!j.is_object()) {
        return std::unexpected(std::string("Invalid parameters: expected an object"));
    }
    if (!j.contains("tab_id") || !j["tab_id"].is_string()) {
        return std::unexpected(std::string("Invalid parameters: missing string field 'tab_id'"));
    }
    if (!j.contains("title") || !j["title"].is_string()) {
        return std::unexpected(std::string("Invalid parameters: missing string field 'title'"));
    }

    try {
        CreateSessionWindowParams p;
        p.tab_id = j["tab_id"].get<std::string>();
        p.title = j["title"].get<std::string>();
        p.session_id = optional_string(j, "session_id");
        p.project_path = optional_string(j, "project_path");
        p.engine = optional_string(j, "engine");
        return p;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("Invalid parameters: ") + e.what());
    }
}

json CreateSessionWindowParams::to_json() const {
    json j = {{"tab_id", tab_id}, {"title", title}};
    if (session_id) j["session_id"] = *session_id;
    if (project_path) j["project_path"] = *project_path;
    if (engine) j["engine"] = *engine;
    return j;
}

json WindowCreationResult::to_json() const {
    return {{"window_label", window_label}, {"success", success}};
}

std::string session_window_label(const std::string& tab_id) {
    return std::string(kSessionWindowPrefix) + tab_id;
}

bool is_session_window_label(std::string_view label) {
    return label.starts_with(kSessionWindowPrefix);
}

std::string url_encode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') ||
                          c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out += std::format("%{:02X}", c);
        }
    }
    return out;
}

std::string build_session_url(const CreateSessionWindowParams& params) {
    std::vector<std::string> query = {
        "window=session",
        "tab_id=" + params.tab_id,
    };

    if (params.session_id) query.push_back("session_id=" + *params.session_id);
    if (params.project_path) query.push_back("project_path=" + url_encode(*params.project_path));
    if (params.engine) query.push_back("engine=" + *params.engine);

    std::string url = "/?";
    for (size_t i = 0; i < query.size(); ++i) {
        if (i > 0) url += '&';
        url += query[i];
    }
    return url;
}
