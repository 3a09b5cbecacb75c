#pragma once

#include "error.hpp"
#include "platform/accessibility.hpp"

#include <cstddef>
#include <expected>
#include <string>

// Ad hoc find parameters of a hand-written macro step; no stored path.
struct ControlQuery {
    std::string control;       // best-match text: a name or a control type
    std::string stable_id;
    std::string control_type;  // narrows every other key
    std::string name;
    std::string name_regex;    // ECMAScript, anchored at the start of the name

    bool empty() const {
        return control.empty() && stable_id.empty() && name.empty() && name_regex.empty();
    }
};

// First control below window_root satisfying the query. Key precedence:
// control, stable_id, name_regex, name.
std::expected<ControlRef, Error> find_control(const ControlRef& window_root, const ControlQuery& query,
                                              size_t max_nodes = 5000);
