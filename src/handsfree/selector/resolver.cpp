#include "selector/resolver.hpp"

#include "selector/tree_search.hpp"

#include <algorithm>
#include <format>
#include <iterator>

SelectorResolver::SelectorResolver(size_t max_search_nodes)
    : max_search_nodes_(max_search_nodes) {}

std::expected<Resolution, Error>
SelectorResolver::resolve(const ControlRef& window_root, const Selector& sel) const {
    if (sel.targets.empty()) {
        return fail(ErrorKind::Unresolvable, "selector has no targets");
    }

    Error last{ErrorKind::LookupFailed, ""};
    for (size_t i = 0; i < sel.targets.size(); ++i) {
        auto control = resolve_candidate(window_root, sel.targets[i]);
        if (control) {
            return Resolution{
                .control = std::move(*control),
                .candidate_index = i,
                .attempts = i + 1,
            };
        }
        last = std::move(control.error());
    }

    return fail(ErrorKind::Unresolvable,
                std::format("all {} targets failed, last: {}", sel.targets.size(), describe(last)));
}

std::expected<ControlRef, Error>
SelectorResolver::resolve_candidate(const ControlRef& window_root, const TargetCandidate& target) const {
    if (!window_root) {
        return fail(ErrorKind::LookupFailed, "no window root");
    }

    SelectorStep query;
    if (!target.control_type.empty()) query.control_type = target.control_type;

    switch (target.kind) {
        case TargetCandidate::Kind::StableId:
            query.stable_id = target.stable_id;
            return find_unique(window_root, query, target.native_class);
        case TargetCandidate::Kind::Name:
            query.name = target.name;
            return find_unique(window_root, query, target.native_class);
        case TargetCandidate::Kind::Path:
            return resolve_path(window_root, target.path);
    }
    return fail(ErrorKind::LookupFailed, "unknown target kind");
}

std::expected<ControlRef, Error>
SelectorResolver::resolve_path(const ControlRef& window_root, const std::vector<SelectorStep>& path) const {
    ControlRef cur = window_root;
    for (size_t hop = 0; hop < path.size(); ++hop) {
        auto next = resolve_hop(cur, path[hop], hop);
        if (!next) return std::unexpected(next.error());
        cur = std::move(*next);
    }
    return cur;
}

std::expected<ControlRef, Error>
SelectorResolver::resolve_hop(const ControlRef& node, const SelectorStep& step, size_t hop) const {
    // Fast path: attribute-indexed lookup below the current node.
    if (step.control_type && (step.stable_id || step.name)) {
        SelectorStep query;
        query.control_type = step.control_type;
        if (step.stable_id) query.stable_id = step.stable_id;
        else query.name = step.name;

        auto hit = find_unique(node, query, step.native_class.value_or(""));
        if (hit) return hit;
    }

    auto children = node->children();
    if (!children) {
        return fail(ErrorKind::LookupFailed,
                    std::format("hop {}: children unavailable: {}", hop, children.error().message));
    }

    std::vector<ControlRef> found;
    for (const auto& child : *children) {
        if (child && matches(child->attributes(), step)) found.push_back(child);
    }

    if (found.empty()) {
        return fail(ErrorKind::LookupFailed, std::format("hop {}: no child matched", hop));
    }
    if (found.size() == 1 || !step.sibling_index) {
        return found.front();
    }

    // The recorded index is a position among all siblings; prefer it when
    // that sibling is one of the matches, else clamp into the match list.
    int index = std::max(*step.sibling_index, 0);
    if (static_cast<size_t>(index) < children->size()) {
        const auto& positional = (*children)[static_cast<size_t>(index)];
        for (const auto& m : found) {
            if (m == positional) return m;
        }
    }
    return found[std::min(static_cast<size_t>(index), found.size() - 1)];
}

std::expected<ControlRef, Error>
SelectorResolver::find_unique(const ControlRef& root, const SelectorStep& query,
                              const std::string& class_hint) const {
    auto found = find_descendants(
        root, [&query](const ControlAttributes& attrs) { return matches(attrs, query); },
        max_search_nodes_);

    if (found.size() > 1 && !class_hint.empty()) {
        std::vector<ControlRef> narrowed;
        std::copy_if(found.begin(), found.end(), std::back_inserter(narrowed),
                     [&class_hint](const ControlRef& c) { return c->attributes().native_class == class_hint; });
        if (!narrowed.empty()) found = std::move(narrowed);
    }

    if (found.empty()) {
        return fail(ErrorKind::LookupFailed, "no control matched " + selector::encode(query).dump());
    }
    if (found.size() > 1) {
        return fail(ErrorKind::LookupFailed,
                    std::format("{} controls matched {}", found.size(), selector::encode(query).dump()));
    }
    return found.front();
}
