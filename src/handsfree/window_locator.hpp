#pragma once

#include "error.hpp"
#include "platform/window_manager.hpp"
#include "selector/selector.hpp"
#include "sway/window_info.hpp"

#include <expected>

// Resolves a WindowDescriptor to a live top-level window. When several
// windows match, the first in the window manager's order wins.
class WindowLocator {
public:
    explicit WindowLocator(WindowManager& wm);

    std::expected<WindowInfo, Error> locate(const WindowDescriptor& descriptor);

    // Brings the window to the foreground; required before reliable click/type.
    std::expected<void, Error> focus(const WindowInfo& window);

    // locate() followed by focus().
    std::expected<WindowInfo, Error> locate_and_focus(const WindowDescriptor& descriptor);

private:
    WindowManager& wm_;
};
