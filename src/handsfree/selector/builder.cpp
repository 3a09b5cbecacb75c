#include "selector/builder.hpp"

#include <algorithm>
#include <format>

namespace {

std::optional<std::string> non_empty(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

std::optional<int> index_among_siblings(const ControlRef& parent, const ControlRef& node) {
    auto siblings = parent->children();
    if (!siblings) return std::nullopt;
    for (size_t i = 0; i < siblings->size(); ++i) {
        const auto& sib = (*siblings)[i];
        if (sib && sib->same_as(*node)) return static_cast<int>(i);
    }
    return std::nullopt;
}

} // namespace

SelectorBuilder::SelectorBuilder(size_t max_hops)
    : max_hops_(max_hops) {}

std::expected<std::vector<SelectorStep>, Error>
SelectorBuilder::structural_path(const ControlRef& control, const ControlRef& window_root) const {
    if (!control || !window_root) {
        return fail(ErrorKind::DetachedElement, "null control or window root");
    }

    std::vector<ControlRef> chain{control};
    bool reached = control->same_as(*window_root);
    for (size_t hop = 0; !reached && hop < max_hops_; ++hop) {
        auto parent = chain.back()->parent();
        if (!parent) {
            return fail(ErrorKind::DetachedElement, "parent lookup failed: " + parent.error().message);
        }
        if (!*parent) break;
        chain.push_back(*parent);
        reached = (*parent)->same_as(*window_root);
    }

    if (!reached) {
        return fail(ErrorKind::DetachedElement,
                    std::format("window root not reached after {} hops", chain.size() - 1));
    }

    std::reverse(chain.begin(), chain.end());

    std::vector<SelectorStep> path;
    path.reserve(chain.size() - 1);
    for (size_t i = 1; i < chain.size(); ++i) {
        auto attrs = chain[i]->attributes();
        SelectorStep step;
        step.control_type = non_empty(attrs.control_type);
        step.name = non_empty(attrs.name);
        step.stable_id = non_empty(attrs.stable_id);
        step.native_class = non_empty(attrs.native_class);
        step.sibling_index = index_among_siblings(chain[i - 1], chain[i]);
        path.push_back(std::move(step));
    }
    return path;
}

std::expected<Selector, Error>
SelectorBuilder::build(const ControlRef& control, const ControlRef& window_root) const {
    auto path = structural_path(control, window_root);
    if (!path) return std::unexpected(path.error());

    auto attrs = control->attributes();

    Selector sel;
    sel.window.title = window_root->attributes().name;

    if (!attrs.stable_id.empty()) {
        sel.targets.push_back(TargetCandidate::by_stable_id(attrs.stable_id, attrs.control_type));
    }
    if (!attrs.name.empty()) {
        sel.targets.push_back(TargetCandidate::by_name(attrs.name, attrs.control_type));
    }
    for (auto& t : sel.targets) t.native_class = attrs.native_class;

    sel.targets.push_back(TargetCandidate::by_path(std::move(*path)));
    return sel;
}
