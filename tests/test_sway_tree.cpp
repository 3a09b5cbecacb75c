#include <catch2/catch_test_macros.hpp>

#include "sway/ipc.hpp"
#include "sway/window_info.hpp"

using json = nlohmann::json;

namespace {

// Trimmed get_tree reply: one output, one workspace, a tiled native window,
// a tiled XWayland window and a floating window.
const json TREE = json::parse(R"({
    "id": 1, "type": "root", "name": "root",
    "nodes": [{
        "id": 3, "type": "output", "name": "eDP-1",
        "nodes": [{
            "id": 5, "type": "workspace", "name": "1",
            "nodes": [
                {"id": 10, "type": "con", "name": "Untitled - gedit", "app_id": "org.gnome.gedit",
                 "pid": 4242, "focused": false,
                 "rect": {"x": 0, "y": 30, "width": 960, "height": 1050}, "nodes": []},
                {"id": 11, "type": "con", "name": "Calculator", "app_id": null, "pid": 4343,
                 "focused": true, "window_properties": {"class": "XCalc"},
                 "rect": {"x": 960, "y": 30, "width": 960, "height": 1050}, "nodes": []}
            ],
            "floating_nodes": [
                {"id": 12, "type": "floating_con", "name": "Picture-in-Picture", "app_id": "firefox",
                 "pid": 5000, "focused": false, "nodes": []}
            ]
        }]
    }]
})");

} // namespace

TEST_CASE("SwayTree", "[sway]") {

    SECTION("CollectsWindowsInTreeOrder") {
        auto windows = SwayIpc::collect_windows(TREE);
        REQUIRE(windows.size() == 3);
        REQUIRE(windows[0].handle == 10);
        REQUIRE(windows[1].handle == 11);
        REQUIRE(windows[2].handle == 12);
    }

    SECTION("NativeWindowFields") {
        auto w = SwayIpc::collect_windows(TREE)[0];
        REQUIRE(w.app_id == "org.gnome.gedit");
        REQUIRE(w.window_class.empty());
        REQUIRE(w.title == "Untitled - gedit");
        REQUIRE(w.pid == 4242);
        REQUIRE(w.rect.x == 0);
        REQUIRE(w.rect.y == 30);
        REQUIRE(w.rect.width == 960);
        REQUIRE(w.rect.height == 1050);
    }

    SECTION("XWaylandNullAppId") {
        auto w = SwayIpc::collect_windows(TREE)[1];
        REQUIRE(w.app_id.empty());
        REQUIRE(w.window_class == "XCalc");
    }

    SECTION("FindFocused") {
        auto w = SwayIpc::find_focused(TREE);
        REQUIRE(w.handle == 11);
        REQUIRE(w.title == "Calculator");
    }

    SECTION("NoFocusedWindow") {
        auto tree = json::parse(R"({"id": 1, "type": "root", "nodes": [
            {"id": 5, "type": "workspace", "name": "1", "focused": true, "nodes": []}]})");
        REQUIRE(SwayIpc::collect_windows(tree).empty());
        REQUIRE(SwayIpc::find_focused(tree).empty());
    }

    SECTION("SplitContainersAreNotWindows") {
        auto tree = json::parse(R"({"id": 1, "type": "workspace", "nodes": [
            {"id": 20, "type": "con", "layout": "splitv", "nodes": [
                {"id": 21, "type": "con", "name": "top", "app_id": "foot", "pid": 1},
                {"id": 22, "type": "con", "name": "bottom", "app_id": "foot", "pid": 2}]}]})");
        auto windows = SwayIpc::collect_windows(tree);
        REQUIRE(windows.size() == 2);
        REQUIRE(windows[0].title == "top");
        REQUIRE(windows[1].title == "bottom");
    }
}

TEST_CASE("WindowInfo", "[window]") {

    SECTION("DefaultIsEmpty") {
        WindowInfo info;
        REQUIRE(info.empty());
    }

    SECTION("HandleAloneIsNotEmpty") {
        WindowInfo info;
        info.handle = 7;
        REQUIRE_FALSE(info.empty());
    }

    SECTION("WithWindowClassNotEmpty") {
        WindowInfo info;
        info.window_class = "Firefox";
        REQUIRE_FALSE(info.empty());
    }
}
