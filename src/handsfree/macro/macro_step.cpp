#include "macro/macro_step.hpp"

#include <array>
#include <filesystem>
#include <format>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr std::array<std::pair<Action, const char*>, 11> ACTION_NAMES = {{
    {Action::Focus, "focus"},
    {Action::Click, "click"},
    {Action::Type, "type"},
    {Action::Sleep, "sleep"},
    {Action::StartApp, "start-app"},
    {Action::Drag, "drag"},
    {Action::BrowserOpen, "browser-open"},
    {Action::BrowserNavigate, "browser-navigate"},
    {Action::BrowserClick, "browser-click"},
    {Action::BrowserType, "browser-type"},
    {Action::BrowserEval, "browser-eval"},
}};

} // namespace

std::optional<Action> parse_action(std::string_view name) {
    for (const auto& [action, text] : ACTION_NAMES) {
        if (name == text) return action;
    }
    return std::nullopt;
}

const char* action_name(Action action) {
    for (const auto& [a, text] : ACTION_NAMES) {
        if (a == action) return text;
    }
    return "unknown";
}

namespace macro {

std::expected<std::vector<MacroStep>, Error> decode(const json& j) {
    if (!j.is_array()) {
        return fail(ErrorKind::InvalidMacro, "macro must be a list of steps");
    }

    std::vector<MacroStep> steps;
    steps.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        const auto& item = j[i];
        if (!item.is_object() || !item.contains("action") || !item["action"].is_string()) {
            return fail(ErrorKind::InvalidMacro,
                        std::format("invalid step at index {}: expected object with 'action'", i));
        }

        MacroStep step;
        step.action = item["action"].get<std::string>();
        if (item.contains("args") && !item["args"].is_null()) {
            if (!item["args"].is_object()) {
                return fail(ErrorKind::InvalidMacro, std::format("step {}: args must be an object", i));
            }
            step.args = item["args"];
        }
        steps.push_back(std::move(step));
    }
    return steps;
}

json encode(const std::vector<MacroStep>& steps) {
    json out = json::array();
    for (const auto& s : steps) {
        out.push_back({{"action", s.action}, {"args", s.args}});
    }
    return out;
}

std::expected<std::vector<MacroStep>, Error> load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return fail(ErrorKind::Io, "could not open " + path);
    }

    try {
        return decode(json::parse(f));
    } catch (const json::parse_error& e) {
        return fail(ErrorKind::InvalidMacro, std::string("parse error: ") + e.what());
    }
}

std::expected<void, Error> save(const std::string& path, const std::vector<MacroStep>& steps) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    std::ofstream f(path, std::ios::trunc);
    if (!f.is_open()) {
        return fail(ErrorKind::Io, "could not write " + path);
    }
    f << encode(steps).dump(2) << '\n';
    if (!f) {
        return fail(ErrorKind::Io, "write failed for " + path);
    }
    return {};
}

} // namespace macro
