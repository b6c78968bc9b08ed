#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Backend {
        std::string type = "sway";
    } backend;

    struct Frontend {
        std::string base_url = "http://localhost:1420";
        // Windows whose app_id starts with this belong to us; the rest is the label.
        std::string app_id_prefix = "tabdock.";
        // Placeholders: {url} {app_id} {label} {title} {width} {height}
        std::vector<std::string> launcher = {
            "tabdock-webview", "--app-id", "{app_id}", "--title", "{title}", "{url}",
        };
    } frontend;

    struct Window {
        int width = 1000;
        int height = 700;
        int min_width = 600;
        int min_height = 400;
        uint32_t map_timeout_ms = 5000;
    } window;

    static Config load(const std::string& path);
    static Config load_default();
};
