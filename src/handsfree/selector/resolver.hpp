#pragma once

#include "error.hpp"
#include "platform/accessibility.hpp"
#include "selector/selector.hpp"

#include <cstddef>
#include <expected>
#include <vector>

struct Resolution {
    ControlRef control;
    size_t candidate_index = 0;  // which target resolved
    size_t attempts = 0;         // candidates tried, including the winner
};

// Resolves Selectors (and their individual candidates) against a live window
// root. Candidate-level failures are retried against the next candidate; only
// exhaustion is reported, as Unresolvable.
class SelectorResolver {
public:
    explicit SelectorResolver(size_t max_search_nodes = 5000);

    std::expected<Resolution, Error> resolve(const ControlRef& window_root, const Selector& sel) const;

    std::expected<ControlRef, Error> resolve_candidate(const ControlRef& window_root,
                                                       const TargetCandidate& target) const;

    std::expected<ControlRef, Error> resolve_path(const ControlRef& window_root,
                                                  const std::vector<SelectorStep>& path) const;

private:
    // Descendant search that succeeds only on a single match, after narrowing
    // several matches with the class hint.
    std::expected<ControlRef, Error> find_unique(const ControlRef& root, const SelectorStep& query,
                                                 const std::string& class_hint) const;

    std::expected<ControlRef, Error> resolve_hop(const ControlRef& node, const SelectorStep& step,
                                                 size_t hop) const;

    size_t max_search_nodes_;
};
