#pragma once

#include "error.hpp"
#include "platform/input_injector.hpp"

#include <chrono>
#include <expected>
#include <functional>

using SleepFn = std::function<void(std::chrono::milliseconds)>;

namespace gesture {

struct DragOptions {
    int duration_ms = 800;
    int steps = 80;
    int pre_hold_ms = 120;
    int post_hold_ms = 60;
};

// Move, press, dwell, release at absolute screen coordinates.
std::expected<void, Error> click_at(InputInjector& input, int x, int y,
                                    std::chrono::milliseconds dwell, const SleepFn& sleep);

// Left-button drag with linear interpolation. The button is released even
// when an intermediate move fails.
std::expected<void, Error> drag(InputInjector& input, int start_x, int start_y, int end_x, int end_y,
                                const DragOptions& options, const SleepFn& sleep);

} // namespace gesture
