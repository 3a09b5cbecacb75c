#include "platform/linux/keymap.hpp"

#include <array>
#include <linux/input-event-codes.h>
#include <string>
#include <utility>

namespace keymap {

namespace {

struct Printable {
    int code;
    char plain;
    char shifted;
};

constexpr std::array<Printable, 22> PUNCTUATION = {{
    {KEY_SPACE, ' ', ' '},
    {KEY_MINUS, '-', '_'},
    {KEY_EQUAL, '=', '+'},
    {KEY_LEFTBRACE, '[', '{'},
    {KEY_RIGHTBRACE, ']', '}'},
    {KEY_BACKSLASH, '\\', '|'},
    {KEY_SEMICOLON, ';', ':'},
    {KEY_APOSTROPHE, '\'', '"'},
    {KEY_COMMA, ',', '<'},
    {KEY_DOT, '.', '>'},
    {KEY_SLASH, '/', '?'},
    {KEY_GRAVE, '`', '~'},
    {KEY_KP0, '0', '0'},
    {KEY_KP1, '1', '1'},
    {KEY_KP2, '2', '2'},
    {KEY_KP3, '3', '3'},
    {KEY_KP4, '4', '4'},
    {KEY_KP5, '5', '5'},
    {KEY_KP6, '6', '6'},
    {KEY_KP7, '7', '7'},
    {KEY_KP8, '8', '8'},
    {KEY_KP9, '9', '9'},
}};

// Letters are not contiguous in the evdev code space.
constexpr std::array<int, 26> LETTERS = {
    KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_I, KEY_J, KEY_K, KEY_L, KEY_M,
    KEY_N, KEY_O, KEY_P, KEY_Q, KEY_R, KEY_S, KEY_T, KEY_U, KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z,
};

constexpr char DIGITS_SHIFTED[] = ")!@#$%^&*(";

constexpr std::array<std::pair<std::string_view, int>, 8> NAMED = {{
    {"Escape", KEY_ESC},
    {"Pause", KEY_PAUSE},
    {"ScrollLock", KEY_SCROLLLOCK},
    {"Insert", KEY_INSERT},
    {"Home", KEY_HOME},
    {"End", KEY_END},
    {"PageUp", KEY_PAGEUP},
    {"PageDown", KEY_PAGEDOWN},
}};

constexpr std::array<int, 12> FUNCTION_KEYS = {
    KEY_F1, KEY_F2, KEY_F3, KEY_F4, KEY_F5, KEY_F6,
    KEY_F7, KEY_F8, KEY_F9, KEY_F10, KEY_F11, KEY_F12,
};

} // namespace

std::optional<int> key_code(std::string_view name) {
    if (name.size() >= 2 && (name[0] == 'F' || name[0] == 'f')) {
        int n = 0;
        for (char c : name.substr(1)) {
            if (c < '0' || c > '9') { n = 0; break; }
            n = n * 10 + (c - '0');
        }
        if (n >= 1 && n <= static_cast<int>(FUNCTION_KEYS.size())) return FUNCTION_KEYS[n - 1];
    }
    for (const auto& [key, code] : NAMED) {
        if (key == name) return code;
    }
    return std::nullopt;
}

bool is_modifier(int code) {
    switch (code) {
        case KEY_LEFTSHIFT:
        case KEY_RIGHTSHIFT:
        case KEY_LEFTCTRL:
        case KEY_RIGHTCTRL:
        case KEY_LEFTALT:
        case KEY_RIGHTALT:
        case KEY_LEFTMETA:
        case KEY_RIGHTMETA:
            return true;
        default:
            return false;
    }
}

std::optional<char> to_char(int code, bool shift) {
    for (size_t i = 0; i < LETTERS.size(); ++i) {
        if (LETTERS[i] == code) return static_cast<char>((shift ? 'A' : 'a') + i);
    }
    // KEY_1..KEY_9 are contiguous, KEY_0 follows KEY_9.
    if (code >= KEY_1 && code <= KEY_9) {
        int digit = code - KEY_1 + 1;
        return shift ? DIGITS_SHIFTED[digit] : static_cast<char>('0' + digit);
    }
    if (code == KEY_0) return shift ? DIGITS_SHIFTED[0] : '0';
    for (const auto& p : PUNCTUATION) {
        if (p.code == code) return shift ? p.shifted : p.plain;
    }
    return std::nullopt;
}

KeyEvent classify(int code, const Modifiers& mods, int stop_code) {
    if (code == stop_code) return {KeyKind::Stop, ""};
    if (code == KEY_ENTER || code == KEY_KPENTER) return {KeyKind::Enter, ""};
    if (is_modifier(code)) return {KeyKind::Modifier, ""};

    if (!mods.ctrl && !mods.alt && !mods.meta) {
        if (auto c = to_char(code, mods.shift)) return {KeyKind::Printable, std::string(1, *c)};
    }
    return {KeyKind::Other, ""};
}

} // namespace keymap
