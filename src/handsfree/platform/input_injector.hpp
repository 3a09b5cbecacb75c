#pragma once

#include "error.hpp"

#include <expected>
#include <string>

// Absolute-coordinate pointer and keyboard injection.
class InputInjector {
public:
    virtual ~InputInjector() = default;
    virtual std::expected<void, Error> move_to(int x, int y) = 0;
    virtual std::expected<void, Error> left_down() = 0;
    virtual std::expected<void, Error> left_up() = 0;
    virtual std::expected<void, Error> type_text(const std::string& text) = 0;
    virtual std::expected<void, Error> press_enter() = 0;
};
