#pragma once

#include "platform/window_manager.hpp"
#include "sway/ipc.hpp"

class SwayWindowManager : public WindowManager {
public:
    explicit SwayWindowManager(SwayIpc& ipc);

    bool connect() override;
    std::expected<std::vector<WindowInfo>, Error> list_windows() override;
    WindowInfo get_focused_window() override;
    std::expected<void, Error> focus(const WindowInfo& window) override;
    std::expected<void, Error> launch(const std::string& command) override;

private:
    SwayIpc& ipc_;
};
