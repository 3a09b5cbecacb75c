#include "recorder/recorder.hpp"

#include <algorithm>
#include <condition_variable>
#include <format>
#include <mutex>
#include <print>

using Clock = CaptureSession::Clock;

Recorder::Recorder(PointerEventSource& pointer, KeyEventSource& keys, SelectorLookup lookup,
                   Options options, bool verbose)
    : pointer_(pointer)
    , keys_(keys)
    , lookup_(std::move(lookup))
    , options_(options)
    , verbose_(verbose)
    , session_(options.session) {
    options_.idle_poll = std::max(options_.idle_poll, std::chrono::milliseconds(1));
}

Recorder::~Recorder() {
    shutdown();
}

void Recorder::log(const std::string& msg) {
    if (verbose_) std::println(stderr, "[handsfree] {}", msg);
}

bool Recorder::start() {
    if (running_) return true;

    if (!pointer_.start([this](const PointerEvent& ev) { on_pointer(ev); })) {
        std::println(stderr, "recorder: failed to start pointer listener");
        return false;
    }
    if (!keys_.start([this](const KeyEvent& ev) { on_key(ev); })) {
        std::println(stderr, "recorder: failed to start keyboard listener");
        pointer_.stop();
        return false;
    }

    idle_thread_ = std::jthread([this](std::stop_token st) { idle_loop(st); });
    running_ = true;
    log("recording started");
    return true;
}

void Recorder::request_stop() {
    stop_.store(true);
    stop_.notify_all();
}

std::vector<MacroStep> Recorder::wait() {
    stop_.wait(false);
    shutdown();
    return session_.take_steps();
}

void Recorder::shutdown() {
    if (!running_) return;
    running_ = false;

    pointer_.stop();
    keys_.stop();
    idle_thread_.request_stop();
    if (idle_thread_.joinable()) idle_thread_.join();

    session_.on_stop(Clock::now());
    log(std::format("recording stopped, {} step(s)", session_.steps().size()));
}

void Recorder::on_pointer(const PointerEvent& ev) {
    if (!ev.pressed || ev.button != PointerButton::Left || stop_.load()) return;

    // Stamped and flushed before the lookup; keys typed meanwhile follow the click.
    auto pressed_at = Clock::now();
    session_.on_press(pressed_at);

    std::optional<Selector> sel;
    if (lookup_) sel = lookup_(ev.x, ev.y);
    log(std::format("click at ({}, {}){}", ev.x, ev.y, sel ? "" : " without selector"));

    session_.on_click(ev.x, ev.y, std::move(sel), pressed_at);
}

void Recorder::on_key(const KeyEvent& ev) {
    if (stop_.load()) return;

    switch (ev.kind) {
        case KeyKind::Printable:
            session_.on_printable(ev.text, Clock::now());
            break;
        case KeyKind::Enter:
            session_.on_enter(Clock::now());
            break;
        case KeyKind::Other:
            session_.on_other_key(Clock::now());
            break;
        case KeyKind::Modifier:
            break;
        case KeyKind::Stop:
            log("stop key pressed");
            request_stop();
            break;
    }
}

void Recorder::idle_loop(std::stop_token st) {
    std::mutex mu;
    std::condition_variable_any cv;
    std::unique_lock lock(mu);
    while (!st.stop_requested()) {
        cv.wait_for(lock, st, options_.idle_poll, [] { return false; });
        if (st.stop_requested()) break;
        if (session_.on_idle_tick(Clock::now())) log("flushed idle text");
    }
}
