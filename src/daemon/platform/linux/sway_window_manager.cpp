#include "platform/linux/sway_window_manager.hpp"

#include "platform/linux/process_launcher.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <print>
#include <thread>
#include <vector>

class SwayWindowManager::Window : public HostWindow {
public:
    Window(SwayWindowManager& owner, std::string label)
        : owner_(owner), label_(std::move(label)),
          criteria_(app_id_criteria(owner.app_id_for(label_))) {}

    const std::string& label() const override { return label_; }

    std::expected<void, std::string> set_focus() override {
        return owner_.ipc_.run_command(criteria_ + " focus");
    }

    std::expected<void, std::string> close() override {
        return owner_.ipc_.run_command(criteria_ + " kill");
    }

    std::expected<void, std::string> emit(const std::string& event,
                                          const std::string& payload) override {
        return owner_.events_.deliver(label_, event, payload);
    }

    void* native_handle() const override { return nullptr; }

private:
    SwayWindowManager& owner_;
    std::string label_;
    std::string criteria_;
};

SwayWindowManager::SwayWindowManager(const Config& config, EventHub& events, bool verbose)
    : frontend_(config.frontend), map_timeout_ms_(config.window.map_timeout_ms),
      events_(events), verbose_(verbose) {}

SwayWindowManager::~SwayWindowManager() = default;

bool SwayWindowManager::connect() {
    return ipc_.connect();
}

bool SwayWindowManager::subscribe_window_events() {
    return ipc_.subscribe(R"(["window"])");
}

std::string SwayWindowManager::app_id_for(const std::string& label) const {
    return frontend_.app_id_prefix + label;
}

std::optional<std::string> SwayWindowManager::label_for(const std::string& app_id) const {
    if (!app_id.starts_with(frontend_.app_id_prefix)) return std::nullopt;
    auto label = app_id.substr(frontend_.app_id_prefix.size());
    if (label.empty()) return std::nullopt;
    return label;
}

std::vector<std::string> SwayWindowManager::labels_in(const nlohmann::json& tree) const {
    std::vector<std::string> labels;
    for (auto& w : collect_windows(tree)) {
        auto label = label_for(w.app_id);
        // A front-end may map more than one toplevel; report each label once.
        if (label && std::ranges::find(labels, *label) == labels.end()) {
            labels.push_back(*label);
        }
    }
    return labels;
}

std::expected<std::vector<std::string>, std::string> SwayWindowManager::own_labels() {
    auto tree = ipc_.get_tree();
    if (!tree) return std::unexpected(tree.error());
    return labels_in(*tree);
}

std::expected<std::unique_ptr<HostWindow>, std::string>
SwayWindowManager::get_window(const std::string& label) {
    auto own = own_labels();
    if (!own) return std::unexpected(own.error());

    if (std::ranges::find(*own, label) == own->end()) return nullptr;
    return std::make_unique<Window>(*this, label);
}

std::expected<std::vector<std::unique_ptr<HostWindow>>, std::string> SwayWindowManager::windows() {
    auto own = own_labels();
    if (!own) return std::unexpected(own.error());

    std::vector<std::unique_ptr<HostWindow>> out;
    for (auto& label : *own) {
        out.push_back(std::make_unique<Window>(*this, label));
    }
    return out;
}

std::string SwayWindowManager::placement_command(const WindowSpec& spec) const {
    std::string cmd = app_id_criteria(app_id_for(spec.label)) + " floating enable";
    if (!spec.decorations) cmd += ", border none";
    cmd += std::format(", resize set {} {}", spec.width, spec.height);
    if (spec.center) cmd += ", move position center";
    if (!spec.visible) cmd += ", move scratchpad";
    return cmd;
}

std::expected<std::unique_ptr<HostWindow>, std::string>
SwayWindowManager::create_window(const WindowSpec& spec) {
    if (!ipc_.connected()) return std::unexpected(std::string("not connected to sway"));

    std::string base = frontend_.base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();

    auto app_id = app_id_for(spec.label);
    auto argv = expand_placeholders(frontend_.launcher, {
        {"url", base + spec.url},
        {"app_id", app_id},
        {"label", spec.label},
        {"title", spec.title},
        {"width", std::to_string(spec.width)},
        {"height", std::to_string(spec.height)},
    });

    auto pid = spawn_detached(argv);
    if (!pid) return std::unexpected(pid.error());
    log(std::format("Launched front-end for {} (pid {})", spec.label, *pid));

    if (ipc_.event_fd() >= 0) {
        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(map_timeout_ms_);
        pending_.push_back({spec, deadline});
        return nullptr;
    }

    auto mapped = wait_for_map(spec.label);
    if (!mapped) return std::unexpected(mapped.error());

    auto placed = place(spec);
    if (!placed) return std::unexpected(placed.error());

    return std::make_unique<Window>(*this, spec.label);
}

std::expected<void, std::string> SwayWindowManager::place(const WindowSpec& spec) {
    // floating_minimum_size is seat-wide in sway; the last window's value wins.
    auto min_size = ipc_.run_command(
        std::format("floating_minimum_size {} x {}", spec.min_width, spec.min_height));
    if (!min_size) log("floating_minimum_size rejected: " + min_size.error());

    return ipc_.run_command(placement_command(spec));
}

std::expected<void, std::string> SwayWindowManager::wait_for_map(const std::string& label) {
    using namespace std::chrono;
    auto deadline = steady_clock::now() + milliseconds(map_timeout_ms_);

    while (true) {
        auto own = own_labels();
        if (!own) return std::unexpected(own.error());
        if (std::ranges::find(*own, label) != own->end()) return {};

        if (steady_clock::now() >= deadline) {
            return std::unexpected(std::format("window {} did not appear within {} ms",
                                               app_id_for(label), map_timeout_ms_));
        }
        std::this_thread::sleep_for(milliseconds(50));
    }
}

int SwayWindowManager::poll_timeout_ms() const {
    if (pending_.empty()) return -1;

    using namespace std::chrono;
    auto next = std::ranges::min(pending_, {}, &PendingMap::deadline).deadline;
    auto left = duration_cast<milliseconds>(next - steady_clock::now()).count();
    // Round up so the wakeup lands after the deadline, not just before it.
    return left <= 0 ? 0 : static_cast<int>(left) + 1;
}

std::vector<WindowEvent> SwayWindowManager::expire_pending() {
    std::vector<WindowEvent> expired;
    auto now = std::chrono::steady_clock::now();

    std::erase_if(pending_, [&](const PendingMap& p) {
        if (p.deadline > now) return false;
        expired.push_back({
            .change = WindowEvent::Change::CreateFailed,
            .label = p.spec.label,
            .error = std::format("window {} did not appear within {} ms",
                                 app_id_for(p.spec.label), map_timeout_ms_),
        });
        return true;
    });
    return expired;
}

std::optional<WindowEvent> SwayWindowManager::translate_event(const nlohmann::json& payload) const {
    if (!payload.is_object() || !payload.contains("container")) return std::nullopt;
    auto& c = payload["container"];
    if (!c.contains("app_id") || !c["app_id"].is_string()) return std::nullopt;

    auto label = label_for(c["app_id"].get<std::string>());
    if (!label) return std::nullopt;

    WindowEvent event;
    auto change = payload.value("change", "");
    if (change == "new") {
        event.change = WindowEvent::Change::Created;
    } else if (change == "close") {
        event.change = WindowEvent::Change::Closed;
    } else if (change == "focus") {
        event.change = WindowEvent::Change::Focused;
    } else {
        return std::nullopt;
    }
    event.label = *label;
    return event;
}

bool SwayWindowManager::read_event(WindowEvent& event) {
    uint32_t type;
    nlohmann::json payload;
    if (!ipc_.read_event(type, payload)) return false;
    if (type != SwayIpc::EVENT_WINDOW) return false;

    auto translated = translate_event(payload);
    if (!translated) return false;
    event = *translated;

    if (event.change != WindowEvent::Change::Created) return true;

    auto it = std::ranges::find_if(pending_, [&](const PendingMap& p) {
        return p.spec.label == event.label;
    });
    if (it == pending_.end()) return true;

    auto spec = it->spec;
    pending_.erase(it);
    auto placed = place(spec);
    if (!placed) {
        event.change = WindowEvent::Change::CreateFailed;
        event.error = placed.error();
    }
    return true;
}

void SwayWindowManager::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[tabdock] sway: {}", msg);
    }
}
