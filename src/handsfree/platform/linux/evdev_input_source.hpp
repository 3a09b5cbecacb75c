#pragma once

#include "platform/input_source.hpp"
#include "platform/linux/evdev_reader.hpp"
#include "platform/linux/keymap.hpp"

#include <mutex>

// Tracks the pointer by integrating relative motion into a screen-sized
// area. Wayland offers no global cursor query, so the position starts at the
// centre unless set with sync(). Pointer acceleration is not modelled.
class EvdevPointerSource : public PointerEventSource {
public:
    EvdevPointerSource(int screen_width, int screen_height);

    bool start(Handler handler) override;
    void stop() override;

    // Pins the tracked position, e.g. after warping the real cursor there.
    void sync(int x, int y);

    void handle(const input_event& ev);

private:
    void clamp();

    EvdevReader reader_;
    Handler handler_;
    int width_;
    int height_;

    std::mutex mu_;
    int x_;
    int y_;
};

class EvdevKeySource : public KeyEventSource {
public:
    explicit EvdevKeySource(int stop_code);

    bool start(Handler handler) override;
    void stop() override;

    void handle(const input_event& ev);

private:
    EvdevReader reader_;
    Handler handler_;
    int stop_code_;
    keymap::Modifiers mods_;
};
