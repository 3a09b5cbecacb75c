#include "selector/tree_search.hpp"

#include <utility>

bool matches(const ControlAttributes& attrs, const SelectorStep& step) {
    if (step.control_type && attrs.control_type != *step.control_type) return false;
    if (step.stable_id && attrs.stable_id != *step.stable_id) return false;
    if (step.native_class && attrs.native_class != *step.native_class) return false;
    if (step.name && attrs.name != *step.name) return false;
    return true;
}

std::vector<ControlRef> find_descendants(const ControlRef& root, const ControlPredicate& pred,
                                         size_t max_nodes) {
    std::vector<ControlRef> found;
    if (!root) return found;

    // Stack of pending siblings, kept in reverse so pop_back yields document order.
    std::vector<ControlRef> stack;
    auto push_children = [&stack](const ControlRef& node) {
        auto kids = node->children();
        if (!kids) return;
        for (auto it = kids->rbegin(); it != kids->rend(); ++it) {
            if (*it) stack.push_back(*it);
        }
    };

    push_children(root);
    size_t visited = 0;
    while (!stack.empty() && visited < max_nodes) {
        auto node = std::move(stack.back());
        stack.pop_back();
        ++visited;

        if (pred(node->attributes())) found.push_back(node);
        push_children(node);
    }
    return found;
}
