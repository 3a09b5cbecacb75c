#include "input/gestures.hpp"

#include <algorithm>

using namespace std::chrono_literals;

namespace gesture {

std::expected<void, Error> click_at(InputInjector& input, int x, int y,
                                    std::chrono::milliseconds dwell, const SleepFn& sleep) {
    if (auto res = input.move_to(x, y); !res) return res;
    if (auto res = input.left_down(); !res) return res;
    sleep(dwell);
    return input.left_up();
}

std::expected<void, Error> drag(InputInjector& input, int start_x, int start_y, int end_x, int end_y,
                                const DragOptions& options, const SleepFn& sleep) {
    int steps = std::max(1, options.steps);
    auto per_step = std::chrono::milliseconds(std::max(0, options.duration_ms) / steps);

    if (auto res = input.move_to(start_x, start_y); !res) return res;
    sleep(20ms);
    if (auto res = input.left_down(); !res) return res;
    sleep(std::chrono::milliseconds(std::max(0, options.pre_hold_ms)));

    for (int i = 1; i <= steps; ++i) {
        double t = static_cast<double>(i) / steps;
        int x = start_x + static_cast<int>((end_x - start_x) * t);
        int y = start_y + static_cast<int>((end_y - start_y) * t);
        if (auto res = input.move_to(x, y); !res) {
            if (auto released = input.left_up(); !released) {
                return fail(res.error().kind,
                            res.error().message + "; release failed: " + released.error().message);
            }
            return res;
        }
        if (per_step.count() > 0) sleep(per_step);
    }

    sleep(std::chrono::milliseconds(std::max(0, options.post_hold_ms)));
    return input.left_up();
}

} // namespace gesture
