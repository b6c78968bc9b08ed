#include <catch2/catch_test_macros.hpp>

#include "session_window.hpp"

using json = nlohmann::json;

TEST_CASE("Session window labels", "[session_window]") {

    SECTION("LabelFormat") {
        REQUIRE(session_window_label("abc-123") == "session-window-abc-123");
        REQUIRE(session_window_label("") == "session-window-");
    }

    SECTION("PrefixMatch") {
        REQUIRE(is_session_window_label("session-window-1"));
        REQUIRE(is_session_window_label("session-window-"));
        REQUIRE_FALSE(is_session_window_label("main"));
        REQUIRE_FALSE(is_session_window_label("session-window"));
        REQUIRE_FALSE(is_session_window_label("xsession-window-1"));
    }
}

TEST_CASE("Session window URL", "[session_window][url]") {
    CreateSessionWindowParams p;
    p.tab_id = "tab-7";
    p.title = "Project";

    SECTION("TabIdOnly") {
        REQUIRE(build_session_url(p) == "/?window=session&tab_id=tab-7");
    }

    SECTION("AllParameters") {
        p.session_id = "sess-1";
        p.project_path = "/home/me/proj";
        p.engine = "claude";
        REQUIRE(build_session_url(p) ==
                "/?window=session&tab_id=tab-7&session_id=sess-1"
                "&project_path=%2Fhome%2Fme%2Fproj&engine=claude");
    }

    SECTION("OnlySuppliedOptionals") {
        p.engine = "codex";
        auto url = build_session_url(p);
        REQUIRE(url == "/?window=session&tab_id=tab-7&engine=codex");
        REQUIRE(url.find("session_id=") == std::string::npos);
        REQUIRE(url.find("project_path=") == std::string::npos);
    }

    SECTION("ProjectPathReservedCharacters") {
        p.project_path = R"(C:\Users\me\my project&x=1?#)";
        REQUIRE(build_session_url(p) ==
                "/?window=session&tab_id=tab-7"
                "&project_path=C%3A%5CUsers%5Cme%5Cmy%20project%26x%3D1%3F%23");
    }

    SECTION("TitleNotInUrl") {
        p.title = "secret title";
        REQUIRE(build_session_url(p).find("secret") == std::string::npos);
    }
}

TEST_CASE("url_encode", "[session_window][url]") {

    SECTION("UnreservedUntouched") {
        REQUIRE(url_encode("AZaz09-_.~") == "AZaz09-_.~");
    }

    SECTION("ReservedEncodedUpperHex") {
        REQUIRE(url_encode("a b/c") == "a%20b%2Fc");
        REQUIRE(url_encode("%") == "%25");
        REQUIRE(url_encode("+") == "%2B");
    }

    SECTION("Utf8BytesEncoded") {
        REQUIRE(url_encode("\xC3\xA9") == "%C3%A9");
    }

    SECTION("Empty") {
        REQUIRE(url_encode("").empty());
    }
}

TEST_CASE("Session window JSON", "[session_window][json]") {

    SECTION("ParseFull") {
        auto j = json::parse(R"({
            "tab_id": "t1", "title": "T", "session_id": "s",
            "project_path": "/p", "engine": "claude"
        })");
        auto p = CreateSessionWindowParams::from_json(j);
        REQUIRE(p.has_value());
        REQUIRE(p->tab_id == "t1");
        REQUIRE(p->title == "T");
        REQUIRE(p->session_id == "s");
        REQUIRE(p->project_path == "/p");
        REQUIRE(p->engine == "claude");
    }

    SECTION("NullOptionalsStayUnset") {
        auto j = json::parse(R"({"tab_id": "t1", "title": "T", "session_id": null})");
        auto p = CreateSessionWindowParams::from_json(j);
        REQUIRE(p.has_value());
        REQUIRE_FALSE(p->session_id.has_value());
        REQUIRE_FALSE(p->project_path.has_value());
        REQUIRE_FALSE(p->engine.has_value());
    }

    SECTION("MissingTabId") {
        auto p = CreateSessionWindowParams::from_json(json{{"title", "T"}});
        REQUIRE_FALSE(p.has_value());
        REQUIRE(p.error().starts_with("Invalid parameters:"));
    }

    SECTION("MissingTitle") {
        auto p = CreateSessionWindowParams::from_json(json{{"tab_id", "t"}});
        REQUIRE_FALSE(p.has_value());
    }

    SECTION("WrongOptionalType") {
        auto p = CreateSessionWindowParams::from_json(
            json{{"tab_id", "t"}, {"title", "T"}, {"engine", 5}});
        REQUIRE_FALSE(p.has_value());
    }

    SECTION("NotAnObject") {
        REQUIRE_FALSE(CreateSessionWindowParams::from_json(json::array()).has_value());
    }

    SECTION("ToJsonOmitsUnset") {
        CreateSessionWindowParams p;
        p.tab_id = "t";
        p.title = "T";
        auto j = p.to_json();
        REQUIRE(j["tab_id"] == "t");
        REQUIRE_FALSE(j.contains("engine"));
    }

    SECTION("ResultShape") {
        WindowCreationResult r{.window_label = "session-window-t", .success = true};
        auto j = r.to_json();
        REQUIRE(j["window_label"] == "session-window-t");
        REQUIRE(j["success"] == true);
    }
}
