#include <catch2/catch_test_macros.hpp>

#include "fake_platform.hpp"
#include "selector/classic_match.hpp"

TEST_CASE("Classic control matching", "[classic]") {
    auto root = FakeControl::make("frame", "Calculator");
    auto panel = root->add(FakeControl::make("panel", ""));
    auto seven = panel->add(FakeControl::make("push button", "Seven", "num7Button"));
    auto seventy = panel->add(FakeControl::make("push button", "seventy"));
    auto display = panel->add(FakeControl::make("text", "Display is 0", "display"));
    auto edit = panel->add(FakeControl::make("entry", "Memo"));

    SECTION("ControlPrefersExactName") {
        auto c = find_control(root, ControlQuery{.control = "seventy"});
        REQUIRE(c);
        REQUIRE((*c)->same_as(*seventy));
    }

    SECTION("ControlFallsBackToCaseInsensitiveName") {
        auto c = find_control(root, ControlQuery{.control = "SEVEN"});
        REQUIRE(c);
        REQUIRE((*c)->same_as(*seven));
    }

    SECTION("ControlFallsBackToSubstring") {
        auto c = find_control(root, ControlQuery{.control = "display"});
        REQUIRE(c);
        REQUIRE((*c)->same_as(*display));
    }

    SECTION("ControlFallsBackToControlType") {
        auto c = find_control(root, ControlQuery{.control = "entry"});
        REQUIRE(c);
        REQUIRE((*c)->same_as(*edit));
    }

    SECTION("ControlTypeNarrows") {
        auto c = find_control(root, ControlQuery{.control = "Seven", .control_type = "text"});
        REQUIRE_FALSE(c);
        REQUIRE(c.error().kind == ErrorKind::LookupFailed);
    }

    SECTION("StableIdBeatsName") {
        auto c = find_control(root, ControlQuery{.stable_id = "display", .name = "Seven"});
        REQUIRE(c);
        REQUIRE((*c)->same_as(*display));
    }

    SECTION("NameRegexIsAnchoredAtStart") {
        auto c = find_control(root, ControlQuery{.name_regex = "Disp"});
        REQUIRE(c);
        REQUIRE((*c)->same_as(*display));

        auto miss = find_control(root, ControlQuery{.name_regex = "is 0"});
        REQUIRE_FALSE(miss);
    }

    SECTION("BadRegexIsInvalidMacro") {
        auto c = find_control(root, ControlQuery{.name_regex = "(["});
        REQUIRE_FALSE(c);
        REQUIRE(c.error().kind == ErrorKind::InvalidMacro);
    }

    SECTION("ExactName") {
        auto c = find_control(root, ControlQuery{.name = "Memo"});
        REQUIRE(c);
        REQUIRE((*c)->same_as(*edit));
    }

    SECTION("EmptyQueryIsInvalidMacro") {
        auto c = find_control(root, ControlQuery{});
        REQUIRE_FALSE(c);
        REQUIRE(c.error().kind == ErrorKind::InvalidMacro);
    }
}
