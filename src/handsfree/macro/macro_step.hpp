#pragma once

#include "error.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class Action {
    Focus,
    Click,
    Type,
    Sleep,
    StartApp,
    Drag,
    BrowserOpen,
    BrowserNavigate,
    BrowserClick,
    BrowserType,
    BrowserEval,
};

std::optional<Action> parse_action(std::string_view name);
const char* action_name(Action action);

// One persisted macro record. args is kept as parsed so fields this program
// does not interpret survive a load/save cycle.
struct MacroStep {
    std::string action;
    nlohmann::json args = nlohmann::json::object();
};

namespace macro {

std::expected<std::vector<MacroStep>, Error> decode(const nlohmann::json& j);
nlohmann::json encode(const std::vector<MacroStep>& steps);

std::expected<std::vector<MacroStep>, Error> load(const std::string& path);
std::expected<void, Error> save(const std::string& path, const std::vector<MacroStep>& steps);

} // namespace macro
