#pragma once

#include "platform/input_source.hpp"

#include <optional>
#include <string_view>

namespace keymap {

struct Modifiers {
    bool shift = false;
    bool ctrl = false;
    bool alt = false;
    bool meta = false;
};

// Linux key code for a key name such as "F9", "Escape" or "Pause".
std::optional<int> key_code(std::string_view name);

bool is_modifier(int code);

// Character a US layout produces for a key code, or nullopt for
// non-printing keys.
std::optional<char> to_char(int code, bool shift);

// Maps a key press to the recorder's vocabulary. Printable keys chorded with
// ctrl, alt or super are shortcuts and classify as Other.
KeyEvent classify(int code, const Modifiers& mods, int stop_code);

} // namespace keymap
