#include "platform/frame_choice.hpp"

std::optional<size_t> choose_frame(const std::vector<FrameCandidate>& frames, const WindowInfo& window) {
    auto pid_ok = [&window](const FrameCandidate& f) { return window.pid <= 0 || f.pid == window.pid; };

    for (size_t i = 0; i < frames.size(); ++i) {
        if (pid_ok(frames[i]) && frames[i].name == window.title) return i;
    }
    if (window.pid <= 0) return std::nullopt;

    std::optional<size_t> only;
    size_t same_pid = 0;
    for (size_t i = 0; i < frames.size(); ++i) {
        if (frames[i].pid != window.pid) continue;
        if (frames[i].name.empty()) return i;
        ++same_pid;
        only = i;
    }
    if (same_pid == 1) return only;
    return std::nullopt;
}
