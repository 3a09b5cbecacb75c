#pragma once

#include "macro/macro_step.hpp"
#include "platform/input_source.hpp"
#include "recorder/capture_session.hpp"
#include "selector/selector.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <thread>
#include <vector>

// Passive recorder: listens to system-wide pointer and keyboard events and
// turns them into click and type steps while the user works normally.
class Recorder {
public:
    // Runs on the pointer thread, outside the session lock. nullopt when
    // nothing accessible is under the point.
    using SelectorLookup = std::function<std::optional<Selector>(int x, int y)>;

    struct Options {
        std::chrono::milliseconds idle_poll{250};  // floored at 1 ms
        CaptureSession::Options session;
    };

    Recorder(PointerEventSource& pointer, KeyEventSource& keys, SelectorLookup lookup,
             Options options, bool verbose = false);
    ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    bool start();
    // Safe from any thread, including listener callbacks.
    void request_stop();
    bool stop_requested() const { return stop_.load(); }

    // Blocks until stop is requested, tears the listeners down, performs the
    // final flush and returns the recorded steps.
    std::vector<MacroStep> wait();

    const CaptureSession& session() const { return session_; }
    const Options& options() const { return options_; }

private:
    void on_pointer(const PointerEvent& ev);
    void on_key(const KeyEvent& ev);
    void idle_loop(std::stop_token st);
    void shutdown();
    void log(const std::string& msg);

    PointerEventSource& pointer_;
    KeyEventSource& keys_;
    SelectorLookup lookup_;
    Options options_;
    bool verbose_;

    CaptureSession session_;
    std::atomic<bool> stop_{false};
    bool running_ = false;
    std::jthread idle_thread_;
};
