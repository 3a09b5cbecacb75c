#include "selector/classic_match.hpp"

#include "selector/tree_search.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::expected<ControlRef, Error> first_of(const ControlRef& root, const ControlPredicate& pred,
                                          size_t max_nodes, const std::string& what) {
    auto found = find_descendants(root, pred, max_nodes);
    if (found.empty()) {
        return fail(ErrorKind::LookupFailed, "no control matched " + what);
    }
    return found.front();
}

// Exact name, then case-insensitive name, then substring, then control type.
std::expected<ControlRef, Error> best_match(const ControlRef& root, const ControlQuery& q, size_t max_nodes) {
    auto type_ok = [&q](const ControlAttributes& a) {
        return q.control_type.empty() || a.control_type == q.control_type;
    };
    auto want = lower(q.control);

    auto candidates = find_descendants(root, type_ok, max_nodes);

    const std::function<bool(const ControlAttributes&)> tiers[] = {
        [&q](const ControlAttributes& a) { return a.name == q.control; },
        [&want](const ControlAttributes& a) { return lower(a.name) == want; },
        [&want](const ControlAttributes& a) {
            return !a.name.empty() && lower(a.name).find(want) != std::string::npos;
        },
        [&want](const ControlAttributes& a) { return lower(a.control_type) == want; },
    };

    for (const auto& tier : tiers) {
        for (const auto& c : candidates) {
            if (tier(c->attributes())) return c;
        }
    }
    return fail(ErrorKind::LookupFailed, "no best match for '" + q.control + "'");
}

} // namespace

std::expected<ControlRef, Error> find_control(const ControlRef& window_root, const ControlQuery& query,
                                              size_t max_nodes) {
    if (!window_root) {
        return fail(ErrorKind::LookupFailed, "no window root");
    }
    if (query.empty()) {
        return fail(ErrorKind::InvalidMacro, "provide one of: control, stable_id, name, name_regex");
    }

    auto type_ok = [&query](const ControlAttributes& a) {
        return query.control_type.empty() || a.control_type == query.control_type;
    };

    if (!query.control.empty()) {
        return best_match(window_root, query, max_nodes);
    }

    if (!query.stable_id.empty()) {
        return first_of(window_root,
                        [&](const ControlAttributes& a) { return type_ok(a) && a.stable_id == query.stable_id; },
                        max_nodes, "stable_id=" + query.stable_id);
    }

    if (!query.name_regex.empty()) {
        std::regex re;
        try {
            re = std::regex(query.name_regex, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            return fail(ErrorKind::InvalidMacro, "bad name_regex '" + query.name_regex + "': " + e.what());
        }
        return first_of(window_root,
                        [&](const ControlAttributes& a) {
                            return type_ok(a) &&
                                   std::regex_search(a.name, re, std::regex_constants::match_continuous);
                        },
                        max_nodes, "name_regex=" + query.name_regex);
    }

    return first_of(window_root,
                    [&](const ControlAttributes& a) { return type_ok(a) && a.name == query.name; },
                    max_nodes, "name=" + query.name);
}
