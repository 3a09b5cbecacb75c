#pragma once

#include "error.hpp"
#include "sway/window_info.hpp"

#include <expected>
#include <string>
#include <vector>

class WindowManager {
public:
    virtual ~WindowManager() = default;
    virtual bool connect() = 0;
    // Top-level windows in the window manager's own order.
    virtual std::expected<std::vector<WindowInfo>, Error> list_windows() = 0;
    virtual WindowInfo get_focused_window() = 0;
    virtual std::expected<void, Error> focus(const WindowInfo& window) = 0;
    virtual std::expected<void, Error> launch(const std::string& command) = 0;
};
