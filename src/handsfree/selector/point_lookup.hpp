#pragma once

#include "error.hpp"
#include "platform/accessibility.hpp"
#include "selector/builder.hpp"
#include "selector/selector.hpp"

#include <expected>

// Selector for the control under a screen point.
std::expected<Selector, Error> selector_at(AccessibilityEngine& a11y, const SelectorBuilder& builder,
                                           int x, int y);
