#include "platform/linux/evdev_input_source.hpp"

#include <algorithm>

namespace {

bool is_pointer_device(int fd) {
    return EvdevReader::has_bit(fd, EV_KEY, BTN_LEFT) && EvdevReader::has_bit(fd, EV_REL, REL_X);
}

bool is_keyboard_device(int fd) {
    return EvdevReader::has_bit(fd, EV_KEY, KEY_A) && EvdevReader::has_bit(fd, EV_KEY, KEY_ENTER);
}

} // namespace

EvdevPointerSource::EvdevPointerSource(int screen_width, int screen_height)
    : reader_("pointer", is_pointer_device)
    , width_(std::max(1, screen_width))
    , height_(std::max(1, screen_height))
    , x_(width_ / 2)
    , y_(height_ / 2) {}

bool EvdevPointerSource::start(Handler handler) {
    handler_ = std::move(handler);
    return reader_.start([this](const input_event& ev) { handle(ev); });
}

void EvdevPointerSource::stop() {
    reader_.stop();
}

void EvdevPointerSource::sync(int x, int y) {
    std::lock_guard lock(mu_);
    x_ = x;
    y_ = y;
    clamp();
}

void EvdevPointerSource::clamp() {
    x_ = std::clamp(x_, 0, width_ - 1);
    y_ = std::clamp(y_, 0, height_ - 1);
}

void EvdevPointerSource::handle(const input_event& ev) {
    PointerEvent out;
    {
        std::lock_guard lock(mu_);
        if (ev.type == EV_REL) {
            if (ev.code == REL_X) x_ += ev.value;
            else if (ev.code == REL_Y) y_ += ev.value;
            clamp();
            return;
        }
        if (ev.type != EV_KEY) return;

        switch (ev.code) {
            case BTN_LEFT: out.button = PointerButton::Left; break;
            case BTN_RIGHT: out.button = PointerButton::Right; break;
            case BTN_MIDDLE: out.button = PointerButton::Middle; break;
            default: return;
        }
        // 2 is autorepeat, meaningless for buttons.
        if (ev.value == 2) return;
        out.pressed = ev.value == 1;
        out.x = x_;
        out.y = y_;
    }
    if (handler_) handler_(out);
}

EvdevKeySource::EvdevKeySource(int stop_code)
    : reader_("keyboard", is_keyboard_device), stop_code_(stop_code) {}

bool EvdevKeySource::start(Handler handler) {
    handler_ = std::move(handler);
    mods_ = {};
    return reader_.start([this](const input_event& ev) { handle(ev); });
}

void EvdevKeySource::stop() {
    reader_.stop();
}

void EvdevKeySource::handle(const input_event& ev) {
    if (ev.type != EV_KEY) return;

    bool down = ev.value != 0;
    switch (ev.code) {
        case KEY_LEFTSHIFT: case KEY_RIGHTSHIFT: mods_.shift = down; break;
        case KEY_LEFTCTRL: case KEY_RIGHTCTRL: mods_.ctrl = down; break;
        case KEY_LEFTALT: case KEY_RIGHTALT: mods_.alt = down; break;
        case KEY_LEFTMETA: case KEY_RIGHTMETA: mods_.meta = down; break;
        default: break;
    }

    // Presses and autorepeat produce characters; releases do not.
    if (ev.value == 0) return;
    if (ev.value == 2 && keymap::is_modifier(ev.code)) return;

    auto key = keymap::classify(ev.code, mods_, stop_code_);
    if (handler_) handler_(key);
}
