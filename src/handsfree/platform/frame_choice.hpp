#pragma once

#include "sway/window_info.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// A top-level accessible frame as the accessibility bus lists it.
struct FrameCandidate {
    int pid = 0;
    std::string name;
};

// Picks the accessible frame for a sway window: an exact title match (within
// the window's pid when known) first. Without one, a frame of the same pid is
// accepted only when it is untitled or is that process's only frame.
std::optional<size_t> choose_frame(const std::vector<FrameCandidate>& frames, const WindowInfo& window);
