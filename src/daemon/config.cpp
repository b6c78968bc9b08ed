#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Reads a positive integer no larger than `max`; anything else keeps the default.
template <typename T>
void read_positive(const json& section, const char* key, T& out, int64_t max) {
    if (!section.contains(key)) return;
    auto value = section[key].get<int64_t>();
    if (value <= 0 || value > max) {
        std::println(stderr, "config: {} = {} out of range (1..{}), using {}", key, value, max, out);
        return;
    }
    out = static_cast<T>(value);
}

constexpr int64_t kMaxDimension = 16384;
// Stays below the client's 30 s reply timeout.
constexpr int64_t kMaxMapTimeoutMs = 25000;

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("type")) cfg.backend.type = b["type"].get<std::string>();
        }

        if (j.contains("frontend")) {
            auto& fe = j["frontend"];
            if (fe.contains("base_url")) cfg.frontend.base_url = fe["base_url"].get<std::string>();
            if (fe.contains("app_id_prefix"))
                cfg.frontend.app_id_prefix = fe["app_id_prefix"].get<std::string>();
            if (fe.contains("launcher"))
                cfg.frontend.launcher = fe["launcher"].get<std::vector<std::string>>();
        }

        if (j.contains("window")) {
            auto& w = j["window"];
            read_positive(w, "width", cfg.window.width, kMaxDimension);
            read_positive(w, "height", cfg.window.height, kMaxDimension);
            read_positive(w, "min_width", cfg.window.min_width, kMaxDimension);
            read_positive(w, "min_height", cfg.window.min_height, kMaxDimension);
            read_positive(w, "map_timeout_ms", cfg.window.map_timeout_ms, kMaxMapTimeoutMs);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
