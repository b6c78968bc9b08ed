#include "tree.hpp"

namespace {

void walk(const nlohmann::json& node, std::vector<SwayWindow>& out) {
    bool leaf = true;
    for (const char* key : {"nodes", "floating_nodes"}) {
        if (!node.contains(key) || !node[key].is_array()) continue;
        for (auto& child : node[key]) {
            leaf = false;
            walk(child, out);
        }
    }

    if (!leaf) return;
    if (!node.contains("app_id") || !node["app_id"].is_string()) return;

    SwayWindow w;
    w.app_id = node["app_id"].get<std::string>();
    if (node.contains("name") && node["name"].is_string()) w.title = node["name"].get<std::string>();
    w.pid = node.value("pid", 0);
    w.focused = node.value("focused", false);
    if (!w.app_id.empty()) out.push_back(std::move(w));
}

} // namespace

std::vector<SwayWindow> collect_windows(const nlohmann::json& tree) {
    std::vector<SwayWindow> out;
    walk(tree, out);
    return out;
}

std::string escape_criteria(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\\': case '.': case '^': case '$': case '|': case '?': case '*':
            case '+': case '(': case ')': case '[': case ']': case '{': case '}':
                out += '\\';
                out += c;
                break;
            case '"':
                out += "\\\"";
                break;
            default:
                out += c;
        }
    }
    return out;
}

std::string app_id_criteria(std::string_view app_id) {
    return "[app_id=\"^" + escape_criteria(app_id) + "$\"]";
}

std::expected<void, std::string> parse_command_reply(const std::string& payload) {
    nlohmann::json reply;
    try {
        reply = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string("malformed command reply: ") + e.what());
    }

    if (!reply.is_array() || reply.empty()) {
        return std::unexpected(std::string("empty command reply"));
    }

    for (auto& r : reply) {
        if (!r.value("success", false)) {
            return std::unexpected(r.value("error", std::string("command failed")));
        }
    }
    return {};
}
