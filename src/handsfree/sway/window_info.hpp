#pragma once

#include "geometry.hpp"

#include <cstdint>
#include <string>

struct WindowInfo {
    int64_t handle = 0;        // sway container id
    std::string app_id;        // Wayland app_id (e.g. "gedit")
    std::string window_class;  // X11 class for XWayland clients
    std::string title;         // window title
    int pid = 0;               // window process PID
    Rect rect;                 // screen geometry
    bool focused = false;

    bool empty() const { return handle == 0 && app_id.empty() && window_class.empty() && title.empty() && pid == 0; }
};
