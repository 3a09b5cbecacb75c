#pragma once

#include "platform/accessibility.hpp"
#include "selector/selector.hpp"

#include <cstddef>
#include <functional>
#include <vector>

using ControlPredicate = std::function<bool(const ControlAttributes&)>;

// True when every attribute the step sets equals the control's attribute.
bool matches(const ControlAttributes& attrs, const SelectorStep& step);

// Depth-first, document-order search over the descendants of root (root
// itself excluded). At most max_nodes nodes are visited; subtrees whose
// children cannot be read are skipped.
std::vector<ControlRef> find_descendants(const ControlRef& root, const ControlPredicate& pred,
                                         size_t max_nodes);
