#include "recorder/capture_session.hpp"

using json = nlohmann::json;

CaptureSession::CaptureSession()
    : CaptureSession(Options{}) {}

CaptureSession::CaptureSession(Options options)
    : options_(options) {}

void CaptureSession::on_press(Clock::time_point now) {
    std::lock_guard lock(mu_);
    if (stopped_) return;

    flush_locked(false, now);
    press_at_ = now;
}

void CaptureSession::on_click(int x, int y, std::optional<Selector> selector, Clock::time_point now) {
    std::lock_guard lock(mu_);
    if (stopped_) return;

    if (!press_at_) {
        flush_locked(false, now);
        press_at_ = now;
    }

    json args = {{"x", x}, {"y", y}, {"timeout", options_.step_timeout_s}};
    if (selector) {
        args["selector_candidates"] = json::array({selector::encode(*selector)});
    }
    last_selector_ = std::move(selector);
    append_locked("click", std::move(args), *press_at_);
    press_at_.reset();

    release_held_locked();
}

void CaptureSession::on_printable(const std::string& text, Clock::time_point now) {
    std::lock_guard lock(mu_);
    if (stopped_) return;
    if (press_at_) {
        held_.push_back({HeldKey::Kind::Printable, text, now});
        return;
    }
    printable_locked(text, now);
}

void CaptureSession::on_enter(Clock::time_point now) {
    std::lock_guard lock(mu_);
    if (stopped_) return;
    if (press_at_) {
        held_.push_back({HeldKey::Kind::Enter, "", now});
        return;
    }
    flush_locked(true, now);
}

void CaptureSession::on_other_key(Clock::time_point now) {
    std::lock_guard lock(mu_);
    if (stopped_) return;
    if (press_at_) {
        held_.push_back({HeldKey::Kind::Other, "", now});
        return;
    }
    flush_locked(false, now);
}

bool CaptureSession::on_idle_tick(Clock::time_point now) {
    std::lock_guard lock(mu_);
    if (stopped_ || press_at_ || buffer_.empty() || !last_keystroke_) return false;
    if (now - *last_keystroke_ <= options_.idle_flush) return false;

    flush_locked(false, now);
    return true;
}

void CaptureSession::on_stop(Clock::time_point now) {
    std::lock_guard lock(mu_);
    if (stopped_) return;
    // A click whose lookup never completed is dropped; its held keys are not.
    press_at_.reset();
    release_held_locked();
    flush_locked(false, now);
    stopped_ = true;
}

bool CaptureSession::stopped() const {
    std::lock_guard lock(mu_);
    return stopped_;
}

std::string CaptureSession::pending_text() const {
    std::lock_guard lock(mu_);
    return buffer_;
}

std::vector<MacroStep> CaptureSession::steps() const {
    std::lock_guard lock(mu_);
    return steps_;
}

std::vector<MacroStep> CaptureSession::take_steps() {
    std::lock_guard lock(mu_);
    return std::exchange(steps_, {});
}

void CaptureSession::printable_locked(const std::string& text, Clock::time_point now) {
    buffer_ += text;
    last_keystroke_ = now;
}

void CaptureSession::release_held_locked() {
    for (auto& key : std::exchange(held_, {})) {
        switch (key.kind) {
            case HeldKey::Kind::Printable: printable_locked(key.text, key.at); break;
            case HeldKey::Kind::Enter: flush_locked(true, key.at); break;
            case HeldKey::Kind::Other: flush_locked(false, key.at); break;
        }
    }
}

void CaptureSession::flush_locked(bool enter, Clock::time_point now) {
    if (buffer_.empty() && !enter) return;

    json candidates = json::array();
    if (last_selector_) candidates.push_back(selector::encode(*last_selector_));

    json args = {
        {"selector_candidates", std::move(candidates)},
        {"text", buffer_},
        {"enter", enter},
        {"timeout", options_.step_timeout_s},
    };
    buffer_.clear();
    last_keystroke_.reset();
    append_locked("type", std::move(args), now);
}

void CaptureSession::append_locked(std::string action, json args, Clock::time_point now) {
    int64_t delay = 0;
    if (last_step_) {
        delay = std::chrono::duration_cast<std::chrono::milliseconds>(now - *last_step_).count();
    }
    last_step_ = now;
    args["delay_before"] = delay;
    steps_.push_back(MacroStep{.action = std::move(action), .args = std::move(args)});
}
