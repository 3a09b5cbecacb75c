#pragma once

#include "error.hpp"
#include "input/gestures.hpp"
#include "macro/macro_step.hpp"
#include "platform/accessibility.hpp"
#include "platform/browser.hpp"
#include "platform/input_injector.hpp"
#include "platform/window_manager.hpp"
#include "selector/classic_match.hpp"
#include "selector/resolver.hpp"
#include "selector/selector.hpp"
#include "sway/window_info.hpp"
#include "window_locator.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct EngineConfig {
    std::chrono::milliseconds delay_cap{5000};
    std::chrono::milliseconds poll_interval{500};
    std::chrono::milliseconds click_dwell{50};
    int default_timeout_s = 20;
    size_t max_search_nodes = 5000;
};

enum class StepOutcome {
    Done,
    Degraded,  // click landed through the raw-coordinate fallback
};

struct RunReport {
    size_t steps_executed = 0;
    size_t degraded = 0;
};

struct RunFailure {
    size_t step_index = 0;
    std::string action;
    Error error;
};

// Replays macro steps strictly in order against live windows. The only state
// carried between steps is the current window; controls are re-resolved on
// every step.
class MacroEngine {
public:
    MacroEngine(EngineConfig config, WindowManager& wm, AccessibilityEngine& a11y,
                InputInjector& input, BrowserEngine* browser, bool verbose = false);

    MacroEngine(const MacroEngine&) = delete;
    MacroEngine& operator=(const MacroEngine&) = delete;

    // Validates the whole macro first (an unknown action or malformed selector
    // runs nothing), then executes until the first failing step.
    std::expected<RunReport, RunFailure> run(const std::vector<MacroStep>& steps);

    std::expected<StepOutcome, Error> execute(const MacroStep& step);

    const std::optional<WindowInfo>& current_window() const { return current_window_; }

    void set_sleep(SleepFn sleep) { sleep_ = std::move(sleep); }

private:
    std::expected<StepOutcome, Error> dispatch(Action action, const nlohmann::json& args);

    std::expected<StepOutcome, Error> do_focus(const nlohmann::json& args);
    std::expected<StepOutcome, Error> do_click(const nlohmann::json& args);
    std::expected<StepOutcome, Error> do_type(const nlohmann::json& args);
    std::expected<StepOutcome, Error> do_sleep(const nlohmann::json& args);
    std::expected<StepOutcome, Error> do_start_app(const nlohmann::json& args);
    std::expected<StepOutcome, Error> do_drag(const nlohmann::json& args);
    std::expected<StepOutcome, Error> do_browser(Action action, const nlohmann::json& args);

    // Selector candidates, then single selector, then classic matching.
    std::expected<ControlRef, Error> resolve_target(const nlohmann::json& args);
    std::expected<ControlRef, Error> resolve_selector(const Selector& sel);
    std::expected<ControlRef, Error> resolve_classic(const ControlQuery& query);

    std::expected<void, Error> click_control(const ControlRef& control);

    // Retries attempt() until it succeeds, fails permanently, or the step
    // timeout elapses. A zero timeout means a single attempt.
    template <typename T, typename F>
    std::expected<T, Error> with_timeout(int timeout_s, F&& attempt);

    int timeout_of(const nlohmann::json& args) const;
    void apply_delay(const nlohmann::json& args);
    void log(const std::string& msg);

    EngineConfig config_;
    WindowManager& wm_;
    WindowLocator locator_;
    AccessibilityEngine& a11y_;
    InputInjector& input_;
    BrowserEngine* browser_;
    SelectorResolver resolver_;
    bool verbose_;
    SleepFn sleep_;

    std::optional<WindowInfo> current_window_;
};
