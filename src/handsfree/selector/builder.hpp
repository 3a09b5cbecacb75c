#pragma once

#include "error.hpp"
#include "platform/accessibility.hpp"
#include "selector/selector.hpp"

#include <cstddef>
#include <expected>
#include <vector>

// Produces a ranked Selector for a live control: stable id, then name, then
// the structural path, which is always present.
class SelectorBuilder {
public:
    explicit SelectorBuilder(size_t max_hops = 256);

    std::expected<Selector, Error> build(const ControlRef& control, const ControlRef& window_root) const;

    // Root-first path from window_root (exclusive) to control (inclusive).
    // Fails with DetachedElement when the ancestor walk does not reach the
    // root within max_hops.
    std::expected<std::vector<SelectorStep>, Error>
        structural_path(const ControlRef& control, const ControlRef& window_root) const;

private:
    size_t max_hops_;
};
