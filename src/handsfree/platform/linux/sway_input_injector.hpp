#pragma once

#include "platform/input_injector.hpp"
#include "sway/ipc.hpp"

#include <string>

// Pointer through sway's seat cursor commands, keyboard through wtype.
class SwayInputInjector : public InputInjector {
public:
    SwayInputInjector(SwayIpc& ipc, std::string seat);

    std::expected<void, Error> move_to(int x, int y) override;
    std::expected<void, Error> left_down() override;
    std::expected<void, Error> left_up() override;
    std::expected<void, Error> type_text(const std::string& text) override;
    std::expected<void, Error> press_enter() override;

private:
    SwayIpc& ipc_;
    std::string seat_;
};
