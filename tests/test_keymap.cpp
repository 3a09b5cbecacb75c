#include <catch2/catch_test_macros.hpp>

#include "platform/linux/keymap.hpp"

#include <linux/input-event-codes.h>

TEST_CASE("Keymap", "[keymap]") {
    keymap::Modifiers none;
    keymap::Modifiers shift{.shift = true};
    keymap::Modifiers ctrl{.ctrl = true};
    int stop = KEY_F9;

    SECTION("Letters") {
        REQUIRE(keymap::to_char(KEY_A, false) == 'a');
        REQUIRE(keymap::to_char(KEY_Q, true) == 'Q');
        REQUIRE(keymap::to_char(KEY_Z, false) == 'z');
    }

    SECTION("DigitsAndShiftedDigits") {
        REQUIRE(keymap::to_char(KEY_1, false) == '1');
        REQUIRE(keymap::to_char(KEY_0, false) == '0');
        REQUIRE(keymap::to_char(KEY_2, true) == '@');
        REQUIRE(keymap::to_char(KEY_0, true) == ')');
    }

    SECTION("Punctuation") {
        REQUIRE(keymap::to_char(KEY_SPACE, false) == ' ');
        REQUIRE(keymap::to_char(KEY_SLASH, true) == '?');
        REQUIRE(keymap::to_char(KEY_APOSTROPHE, true) == '"');
        REQUIRE(keymap::to_char(KEY_KP7, false) == '7');
    }

    SECTION("NonPrinting") {
        REQUIRE_FALSE(keymap::to_char(KEY_TAB, false));
        REQUIRE_FALSE(keymap::to_char(KEY_BACKSPACE, false));
        REQUIRE_FALSE(keymap::to_char(KEY_LEFTSHIFT, false));
    }

    SECTION("Classify") {
        auto a = keymap::classify(KEY_A, shift, stop);
        REQUIRE(a.kind == KeyKind::Printable);
        REQUIRE(a.text == "A");

        REQUIRE(keymap::classify(KEY_ENTER, none, stop).kind == KeyKind::Enter);
        REQUIRE(keymap::classify(KEY_KPENTER, none, stop).kind == KeyKind::Enter);
        REQUIRE(keymap::classify(KEY_LEFTCTRL, none, stop).kind == KeyKind::Modifier);
        REQUIRE(keymap::classify(KEY_BACKSPACE, none, stop).kind == KeyKind::Other);
        REQUIRE(keymap::classify(KEY_F9, none, stop).kind == KeyKind::Stop);
    }

    SECTION("ShortcutsAreNotText") {
        REQUIRE(keymap::classify(KEY_C, ctrl, stop).kind == KeyKind::Other);
        REQUIRE(keymap::classify(KEY_TAB, keymap::Modifiers{.alt = true}, stop).kind == KeyKind::Other);
    }

    SECTION("KeyNames") {
        REQUIRE(keymap::key_code("F9") == KEY_F9);
        REQUIRE(keymap::key_code("f12") == KEY_F12);
        REQUIRE(keymap::key_code("Escape") == KEY_ESC);
        REQUIRE(keymap::key_code("Pause") == KEY_PAUSE);
        REQUIRE_FALSE(keymap::key_code("F13"));
        REQUIRE_FALSE(keymap::key_code("F"));
        REQUIRE_FALSE(keymap::key_code("Hyper"));
    }
}
