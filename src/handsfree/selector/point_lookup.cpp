#include "selector/point_lookup.hpp"

std::expected<Selector, Error> selector_at(AccessibilityEngine& a11y, const SelectorBuilder& builder,
                                           int x, int y) {
    auto hit = a11y.control_at(x, y);
    if (!hit) return std::unexpected(hit.error());
    if (!hit->control || !hit->window_root) {
        return fail(ErrorKind::LookupFailed, "nothing accessible under the point");
    }
    return builder.build(hit->control, hit->window_root);
}
