#pragma once

#include "error.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Which top-level window. Precedence when several fields are set:
// handle, then title, then title_regex. pid (non-zero) filters further.
struct WindowDescriptor {
    std::string title;
    std::string title_regex;
    std::optional<int64_t> handle;  // only valid within one session
    int pid = 0;

    bool empty() const { return title.empty() && title_regex.empty() && !handle.has_value(); }
};

// One hop of a structural path. Unset fields are wildcards.
struct SelectorStep {
    std::optional<std::string> control_type;
    std::optional<std::string> name;
    std::optional<std::string> stable_id;
    std::optional<std::string> native_class;
    std::optional<int> sibling_index;
};

struct TargetCandidate {
    // Declaration order is the stability ranking.
    enum class Kind { StableId, Name, Path };

    Kind kind = Kind::Path;
    std::string stable_id;
    std::string name;
    std::string control_type;
    std::string native_class;  // tie-break hint for StableId and Name, never binding
    std::vector<SelectorStep> path;

    static TargetCandidate by_stable_id(std::string stable_id, std::string control_type);
    static TargetCandidate by_name(std::string name, std::string control_type);
    static TargetCandidate by_path(std::vector<SelectorStep> path);

    // Short human-readable form for logs.
    std::string summary() const;
};

struct Selector {
    WindowDescriptor window;
    std::vector<TargetCandidate> targets;  // most to least stable
};

namespace selector {

nlohmann::json encode(const WindowDescriptor& window);
nlohmann::json encode(const SelectorStep& step);
nlohmann::json encode(const TargetCandidate& target);
nlohmann::json encode(const Selector& sel);

std::expected<WindowDescriptor, Error> decode_window(const nlohmann::json& j);
std::expected<TargetCandidate, Error> decode_target(const nlohmann::json& j);
std::expected<Selector, Error> decode(const nlohmann::json& j);

// Parses selector JSON text.
std::expected<Selector, Error> parse(const std::string& text);

} // namespace selector
