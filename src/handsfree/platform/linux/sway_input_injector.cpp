#include "platform/linux/sway_input_injector.hpp"

#include "platform/linux/process.hpp"

#include <format>

SwayInputInjector::SwayInputInjector(SwayIpc& ipc, std::string seat)
    : ipc_(ipc), seat_(std::move(seat)) {}

std::expected<void, Error> SwayInputInjector::move_to(int x, int y) {
    return ipc_.run_command(std::format("seat {} cursor set {} {}", seat_, x, y));
}

std::expected<void, Error> SwayInputInjector::left_down() {
    return ipc_.run_command(std::format("seat {} cursor press button1", seat_));
}

std::expected<void, Error> SwayInputInjector::left_up() {
    return ipc_.run_command(std::format("seat {} cursor release button1", seat_));
}

std::expected<void, Error> SwayInputInjector::type_text(const std::string& text) {
    if (text.empty()) return {};
    // -d 10 adds a small delay between characters to avoid overwhelming some apps
    return run_process({"wtype", "-d", "10", text});
}

std::expected<void, Error> SwayInputInjector::press_enter() {
    return run_process({"wtype", "-k", "Return"});
}
