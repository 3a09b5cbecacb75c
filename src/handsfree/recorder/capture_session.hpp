#pragma once

#include "macro/macro_step.hpp"
#include "selector/selector.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Shared recorder state. Every transition runs under one lock; callers do
// their OS and accessibility work before calling in.
class CaptureSession {
public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        uint32_t step_timeout_s = 20;
        std::chrono::milliseconds idle_flush{1500};
    };

    CaptureSession();
    explicit CaptureSession(Options options);

    // Left button press, before the selector lookup: flushes pending text and
    // stamps the click. Keys arriving until on_click are held back so they
    // land after the click.
    void on_press(Clock::time_point now);
    // Completes the click begun by on_press (or presses at `now` if none is
    // pending). A null selector means the lookup failed; the click is kept
    // as coordinates only and clears the selector later typing uses.
    void on_click(int x, int y, std::optional<Selector> selector, Clock::time_point now);
    void on_printable(const std::string& text, Clock::time_point now);
    void on_enter(Clock::time_point now);
    // Navigation and editing keys end the current text run without emitting it as a key.
    void on_other_key(Clock::time_point now);
    // Returns true when pending text was flushed for being idle.
    bool on_idle_tick(Clock::time_point now);
    // Final flush; later events are ignored.
    void on_stop(Clock::time_point now);

    bool stopped() const;
    std::string pending_text() const;
    std::vector<MacroStep> steps() const;
    std::vector<MacroStep> take_steps();

private:
    struct HeldKey {
        enum class Kind { Printable, Enter, Other } kind;
        std::string text;
        Clock::time_point at;
    };

    void printable_locked(const std::string& text, Clock::time_point now);
    void release_held_locked();
    void flush_locked(bool enter, Clock::time_point now);
    void append_locked(std::string action, nlohmann::json args, Clock::time_point now);

    Options options_;

    mutable std::mutex mu_;
    std::string buffer_;
    std::optional<Clock::time_point> last_keystroke_;
    std::optional<Clock::time_point> last_step_;
    std::optional<Selector> last_selector_;
    std::vector<MacroStep> steps_;
    std::optional<Clock::time_point> press_at_;
    std::vector<HeldKey> held_;
    bool stopped_ = false;
};
