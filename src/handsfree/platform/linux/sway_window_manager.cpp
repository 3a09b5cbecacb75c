#include "platform/linux/sway_window_manager.hpp"

#include <format>

SwayWindowManager::SwayWindowManager(SwayIpc& ipc)
    : ipc_(ipc) {}

bool SwayWindowManager::connect() {
    return ipc_.connected() || ipc_.connect();
}

std::expected<std::vector<WindowInfo>, Error> SwayWindowManager::list_windows() {
    auto tree = ipc_.get_tree();
    if (!tree) return std::unexpected(tree.error());
    return SwayIpc::collect_windows(*tree);
}

WindowInfo SwayWindowManager::get_focused_window() {
    auto tree = ipc_.get_tree();
    if (!tree) return {};
    return SwayIpc::find_focused(*tree);
}

std::expected<void, Error> SwayWindowManager::focus(const WindowInfo& window) {
    if (window.handle == 0) return fail(ErrorKind::NotFound, "window has no container id");
    return ipc_.run_command(std::format("[con_id={}] focus", window.handle));
}

std::expected<void, Error> SwayWindowManager::launch(const std::string& command) {
    return ipc_.run_command("exec " + command);
}
