#include "window_locator.hpp"

#include <format>
#include <regex>

WindowLocator::WindowLocator(WindowManager& wm)
    : wm_(wm) {}

std::expected<WindowInfo, Error> WindowLocator::locate(const WindowDescriptor& d) {
    if (d.empty()) {
        return fail(ErrorKind::InvalidSelector, "provide one of: title, title_regex, handle");
    }

    std::regex title_re;
    bool use_regex = !d.handle && d.title.empty();
    if (use_regex) {
        try {
            title_re = std::regex(d.title_regex, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            return fail(ErrorKind::InvalidSelector, "bad title_regex '" + d.title_regex + "': " + e.what());
        }
    }

    auto windows = wm_.list_windows();
    if (!windows) return std::unexpected(windows.error());

    for (const auto& w : *windows) {
        if (d.pid > 0 && w.pid != d.pid) continue;

        if (d.handle) {
            if (w.handle == *d.handle) return w;
        } else if (!d.title.empty()) {
            if (w.title == d.title) return w;
        } else if (std::regex_search(w.title, title_re, std::regex_constants::match_continuous)) {
            return w;
        }
    }

    if (d.handle) return fail(ErrorKind::NotFound, std::format("no window with handle {}", *d.handle));
    if (!d.title.empty()) return fail(ErrorKind::NotFound, "no window titled '" + d.title + "'");
    return fail(ErrorKind::NotFound, "no window title matches '" + d.title_regex + "'");
}

std::expected<void, Error> WindowLocator::focus(const WindowInfo& window) {
    return wm_.focus(window);
}

std::expected<WindowInfo, Error> WindowLocator::locate_and_focus(const WindowDescriptor& d) {
    auto window = locate(d);
    if (!window) return window;

    auto res = focus(*window);
    if (!res) return std::unexpected(res.error());
    return window;
}
