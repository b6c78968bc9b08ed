#include <catch2/catch_test_macros.hpp>

#include "event_hub.hpp"
#include "fake_ipc_server.hpp"
#include "mock_window_manager.hpp"
#include "platform/linux/sway_window_manager.hpp"
#include "window_commands.hpp"

using json = nlohmann::json;

namespace {

// Never connected to sway: every query fails the way a dead socket does.
struct Offline {
    Config config;
    FakeIpcServer ipc;
    EventHub hub{ipc};
    SwayWindowManager sway{config, hub};
};

json window_event(const std::string& change, const json& app_id) {
    return {{"change", change}, {"container", {{"app_id", app_id}, {"name", "x"}}}};
}

} // namespace

TEST_CASE("SwayWindowManager naming", "[sway][host]") {
    Offline o;

    SECTION("AppIdCarriesPrefix") {
        REQUIRE(o.sway.app_id_for("session-window-1") == "tabdock.session-window-1");
    }

    SECTION("LabelStripsPrefix") {
        REQUIRE(o.sway.label_for("tabdock.session-window-1") == "session-window-1");
        REQUIRE(o.sway.label_for("tabdock.main") == "main");
    }

    SECTION("ForeignAndBareAppIdsRejected") {
        REQUIRE_FALSE(o.sway.label_for("firefox").has_value());
        REQUIRE_FALSE(o.sway.label_for("tabdock.").has_value());
        REQUIRE_FALSE(o.sway.label_for("").has_value());
    }

    SECTION("CustomPrefix") {
        Config config;
        config.frontend.app_id_prefix = "com.example.";
        SwayWindowManager custom(config, o.hub);
        REQUIRE(custom.app_id_for("a") == "com.example.a");
        REQUIRE(custom.label_for("com.example.a") == "a");
        REQUIRE_FALSE(custom.label_for("tabdock.a").has_value());
    }
}

TEST_CASE("SwayWindowManager placement", "[sway][host]") {
    Offline o;
    WindowSpec spec;
    spec.label = "session-window-7";
    spec.width = 1000;
    spec.height = 700;
    spec.decorations = false;
    spec.center = true;

    SECTION("SessionWindow") {
        REQUIRE(o.sway.placement_command(spec) ==
                R"([app_id="^tabdock\.session-window-7$"] floating enable, border none, )"
                "resize set 1000 700, move position center");
    }

    SECTION("DecoratedUncentered") {
        spec.decorations = true;
        spec.center = false;
        REQUIRE(o.sway.placement_command(spec) ==
                R"([app_id="^tabdock\.session-window-7$"] floating enable, resize set 1000 700)");
    }

    SECTION("HiddenGoesToScratchpad") {
        spec.visible = false;
        auto cmd = o.sway.placement_command(spec);
        REQUIRE(cmd.ends_with(", move position center, move scratchpad"));
    }
}

TEST_CASE("SwayWindowManager tree labels", "[sway][host]") {
    Offline o;

    auto tree = json::parse(R"({
        "type": "root", "nodes": [
            {"type": "workspace", "nodes": [
                {"type": "con", "app_id": "tabdock.session-window-1", "name": "A", "nodes": []},
                {"type": "con", "app_id": "firefox", "name": "B", "nodes": []},
                {"type": "con", "app_id": "tabdock.main", "name": "C", "nodes": []}
             ],
             "floating_nodes": [
                {"type": "floating_con", "app_id": "tabdock.session-window-1",
                 "name": "A popup", "nodes": []},
                {"type": "floating_con", "app_id": "tabdock.", "name": "D", "nodes": []}
             ]}
        ]
    })");

    SECTION("OwnWindowsOnceInTreeOrder") {
        REQUIRE(o.sway.labels_in(tree) == std::vector<std::string>{"session-window-1", "main"});
    }

    SECTION("EmptyTree") {
        REQUIRE(o.sway.labels_in(json::parse(R"({"type": "root", "nodes": []})")).empty());
    }
}

TEST_CASE("SwayWindowManager events", "[sway][host]") {
    Offline o;

    SECTION("NewCloseFocus") {
        auto created = o.sway.translate_event(window_event("new", "tabdock.session-window-1"));
        REQUIRE(created.has_value());
        REQUIRE(created->change == WindowEvent::Change::Created);
        REQUIRE(created->label == "session-window-1");

        auto closed = o.sway.translate_event(window_event("close", "tabdock.session-window-1"));
        REQUIRE(closed.has_value());
        REQUIRE(closed->change == WindowEvent::Change::Closed);

        auto focused = o.sway.translate_event(window_event("focus", "tabdock.main"));
        REQUIRE(focused.has_value());
        REQUIRE(focused->change == WindowEvent::Change::Focused);
        REQUIRE(focused->label == "main");
    }

    SECTION("OtherChangesIgnored") {
        REQUIRE_FALSE(o.sway.translate_event(window_event("title", "tabdock.main")).has_value());
        REQUIRE_FALSE(o.sway.translate_event(window_event("move", "tabdock.main")).has_value());
    }

    SECTION("ForeignWindowsIgnored") {
        REQUIRE_FALSE(o.sway.translate_event(window_event("close", "firefox")).has_value());
        REQUIRE_FALSE(o.sway.translate_event(window_event("new", nullptr)).has_value());
    }

    SECTION("MalformedPayload") {
        REQUIRE_FALSE(o.sway.translate_event(json{{"change", "new"}}).has_value());
        REQUIRE_FALSE(o.sway.translate_event(json::array()).has_value());
    }
}

TEST_CASE("SwayWindowManager offline", "[sway][host]") {
    Offline o;

    SECTION("QueriesReportHostError") {
        auto window = o.sway.get_window("session-window-1");
        REQUIRE_FALSE(window.has_value());
        REQUIRE(window.error() == "not connected to sway");

        auto all = o.sway.windows();
        REQUIRE_FALSE(all.has_value());
        REQUIRE(all.error() == "not connected to sway");
    }

    SECTION("CreateRefused") {
        auto res = o.sway.create_window(WindowSpec{});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "not connected to sway");
    }

    SECTION("NothingPending") {
        REQUIRE(o.sway.poll_timeout_ms() == -1);
        REQUIRE(o.sway.expire_pending().empty());
    }

    SECTION("CommandsSeeHostFailure") {
        RecordingPainter painter;
        WindowCommands commands(o.sway, painter, Config::Window{});

        auto focus = commands.focus_session_window("session-window-1");
        REQUIRE_FALSE(focus.has_value());
        REQUIRE(focus.error() == "Failed to focus window: not connected to sway");

        auto close = commands.close_session_window("session-window-1");
        REQUIRE_FALSE(close.has_value());
        REQUIRE(close.error() == "Failed to close window: not connected to sway");
    }
}
