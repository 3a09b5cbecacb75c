#include "macro/engine.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <print>
#include <thread>

using json = nlohmann::json;

namespace {

bool is_transient(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:
        case ErrorKind::DetachedElement:
        case ErrorKind::Unresolvable:
        case ErrorKind::LookupFailed:
            return true;
        default:
            return false;
    }
}

// Longest sleep whose nanosecond count still fits in int64.
constexpr int64_t MAX_SLEEP_MS = std::numeric_limits<int64_t>::max() / 1'000'000;

// JSON numbers are doubles of any magnitude; clamp before narrowing.
int64_t clamp_to(double v, int64_t lo, int64_t hi) {
    if (!(v > static_cast<double>(lo))) return lo;
    if (!(v < static_cast<double>(hi))) return hi;
    return static_cast<int64_t>(v);
}

int to_int(double v) {
    return static_cast<int>(clamp_to(v, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
}

std::string string_arg(const json& args, const char* key, const std::string& fallback = "") {
    auto it = args.find(key);
    if (it == args.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

bool bool_arg(const json& args, const char* key, bool fallback) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_boolean()) return fallback;
    return it->get<bool>();
}

std::expected<int, Error> int_arg(const json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_number()) {
        return fail(ErrorKind::InvalidMacro, std::format("missing numeric '{}'", key));
    }
    return to_int(it->get<double>());
}

int int_arg(const json& args, const char* key, int fallback) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_number()) return fallback;
    return to_int(it->get<double>());
}

std::optional<std::pair<int, int>> coordinates(const json& args) {
    auto x = args.find("x");
    auto y = args.find("y");
    if (x == args.end() || y == args.end() || !x->is_number() || !y->is_number()) return std::nullopt;
    return std::pair{to_int(x->get<double>()), to_int(y->get<double>())};
}

ControlQuery classic_query(const json& args) {
    return ControlQuery{
        .control = string_arg(args, "control"),
        .stable_id = string_arg(args, "stable_id"),
        .control_type = string_arg(args, "control_type"),
        .name = string_arg(args, "name"),
        .name_regex = string_arg(args, "name_regex"),
    };
}

// selector_candidates when non-empty, else the single selector, else nothing.
std::expected<std::vector<Selector>, Error> step_selectors(const json& args) {
    std::vector<Selector> out;

    auto list = args.find("selector_candidates");
    if (list != args.end() && !list->is_null()) {
        if (!list->is_array()) {
            return fail(ErrorKind::InvalidMacro, "selector_candidates must be a list");
        }
        for (const auto& item : *list) {
            auto sel = selector::decode(item);
            if (!sel) return fail(ErrorKind::InvalidMacro, sel.error().message);
            out.push_back(std::move(*sel));
        }
        if (!out.empty()) return out;
    }

    auto single = args.find("selector");
    if (single != args.end() && !single->is_null()) {
        auto sel = selector::decode(*single);
        if (!sel) return fail(ErrorKind::InvalidMacro, sel.error().message);
        out.push_back(std::move(*sel));
    }
    return out;
}

// A step-level window_title_regex replaces the stored window identity.
void apply_title_override(std::vector<Selector>& selectors, const json& args) {
    auto re = string_arg(args, "window_title_regex");
    if (re.empty()) return;
    for (auto& sel : selectors) {
        sel.window.handle.reset();
        sel.window.title.clear();
        sel.window.title_regex = re;
    }
}

} // namespace

MacroEngine::MacroEngine(EngineConfig config, WindowManager& wm, AccessibilityEngine& a11y,
                         InputInjector& input, BrowserEngine* browser, bool verbose)
    : config_(config)
    , wm_(wm)
    , locator_(wm)
    , a11y_(a11y)
    , input_(input)
    , browser_(browser)
    , resolver_(config.max_search_nodes)
    , verbose_(verbose)
    , sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
    config_.poll_interval = std::max(config_.poll_interval, std::chrono::milliseconds(1));
}

void MacroEngine::log(const std::string& msg) {
    if (verbose_) std::println(stderr, "[handsfree] {}", msg);
}

std::expected<RunReport, RunFailure> MacroEngine::run(const std::vector<MacroStep>& steps) {
    for (size_t i = 0; i < steps.size(); ++i) {
        const auto& step = steps[i];
        auto action = parse_action(step.action);
        if (!action) {
            return std::unexpected(RunFailure{
                .step_index = i,
                .action = step.action,
                .error = {ErrorKind::UnknownAction, "unknown action '" + step.action + "'"},
            });
        }
        if (*action == Action::Click || *action == Action::Type) {
            if (auto sel = step_selectors(step.args); !sel) {
                return std::unexpected(RunFailure{i, step.action, sel.error()});
            }
        }
    }

    RunReport report;
    for (size_t i = 0; i < steps.size(); ++i) {
        log(std::format("step {}: {}", i, steps[i].action));
        auto outcome = execute(steps[i]);
        if (!outcome) {
            return std::unexpected(RunFailure{i, steps[i].action, outcome.error()});
        }
        ++report.steps_executed;
        if (*outcome == StepOutcome::Degraded) ++report.degraded;
    }
    return report;
}

std::expected<StepOutcome, Error> MacroEngine::execute(const MacroStep& step) {
    auto action = parse_action(step.action);
    if (!action) {
        return fail(ErrorKind::UnknownAction, "unknown action '" + step.action + "'");
    }
    if (!step.args.is_object()) {
        return fail(ErrorKind::InvalidMacro, "step arguments must be a mapping");
    }

    try {
        apply_delay(step.args);
        return dispatch(*action, step.args);
    } catch (const json::exception& e) {
        return fail(ErrorKind::InvalidMacro, std::format("{}: {}", step.action, e.what()));
    }
}

std::expected<StepOutcome, Error> MacroEngine::dispatch(Action action, const json& args) {
    switch (action) {
        case Action::Focus: return do_focus(args);
        case Action::Click: return do_click(args);
        case Action::Type: return do_type(args);
        case Action::Sleep: return do_sleep(args);
        case Action::StartApp: return do_start_app(args);
        case Action::Drag: return do_drag(args);
        case Action::BrowserOpen:
        case Action::BrowserNavigate:
        case Action::BrowserClick:
        case Action::BrowserType:
        case Action::BrowserEval:
            return do_browser(action, args);
    }
    return fail(ErrorKind::UnknownAction, "unhandled action");
}

void MacroEngine::apply_delay(const json& args) {
    auto it = args.find("delay_before");
    if (it == args.end() || !it->is_number()) return;

    auto delay = std::chrono::milliseconds(clamp_to(it->get<double>(), 0, config_.delay_cap.count()));
    if (delay.count() > 0) sleep_(delay);
}

int MacroEngine::timeout_of(const json& args) const {
    return std::max(0, int_arg(args, "timeout", config_.default_timeout_s));
}

template <typename T, typename F>
std::expected<T, Error> MacroEngine::with_timeout(int timeout_s, F&& attempt) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_s);
    for (;;) {
        std::expected<T, Error> res = attempt();
        if (res || !is_transient(res.error().kind)) return res;
        if (std::chrono::steady_clock::now() >= deadline) return res;
        log("retrying: " + describe(res.error()));
        sleep_(config_.poll_interval);
    }
}

std::expected<StepOutcome, Error> MacroEngine::do_focus(const json& args) {
    auto descriptor = selector::decode_window(args);
    if (!descriptor) return std::unexpected(descriptor.error());

    auto window = with_timeout<WindowInfo>(timeout_of(args),
                                           [&] { return locator_.locate_and_focus(*descriptor); });
    if (!window) return std::unexpected(window.error());

    log(std::format("focused '{}' ({})", window->title, window->handle));
    current_window_ = std::move(*window);
    return StepOutcome::Done;
}

std::expected<ControlRef, Error> MacroEngine::resolve_selector(const Selector& sel) {
    WindowInfo window;
    if (!sel.window.empty()) {
        auto located = locator_.locate_and_focus(sel.window);
        if (!located) return std::unexpected(located.error());
        window = std::move(*located);
        current_window_ = window;
    } else if (current_window_) {
        window = *current_window_;
    } else {
        return fail(ErrorKind::LookupFailed, "selector names no window and none is focused");
    }

    auto root = a11y_.window_root(window);
    if (!root) return std::unexpected(root.error());

    auto res = resolver_.resolve(*root, sel);
    if (!res) return std::unexpected(res.error());

    log(std::format("resolved via target {} ({}) after {} attempt(s)", res->candidate_index,
                    sel.targets[res->candidate_index].summary(), res->attempts));
    return res->control;
}

std::expected<ControlRef, Error> MacroEngine::resolve_classic(const ControlQuery& query) {
    if (!current_window_) {
        return fail(ErrorKind::NoActiveWindow, "no active window; add a focus step first");
    }
    auto root = a11y_.window_root(*current_window_);
    if (!root) return std::unexpected(root.error());
    return find_control(*root, query, config_.max_search_nodes);
}

std::expected<ControlRef, Error> MacroEngine::resolve_target(const json& args) {
    auto selectors = step_selectors(args);
    if (!selectors) return std::unexpected(selectors.error());
    apply_title_override(*selectors, args);

    if (!selectors->empty()) {
        return with_timeout<ControlRef>(timeout_of(args), [&]() -> std::expected<ControlRef, Error> {
            Error last{ErrorKind::Unresolvable, ""};
            for (const auto& sel : *selectors) {
                auto control = resolve_selector(sel);
                if (control) return control;
                if (!is_transient(control.error().kind)) return control;
                last = std::move(control.error());
            }
            if (selectors->size() == 1 && last.kind == ErrorKind::Unresolvable) {
                return std::unexpected(last);
            }
            return fail(ErrorKind::Unresolvable,
                        std::format("{} selector(s) failed, last: {}", selectors->size(), describe(last)));
        });
    }

    auto query = classic_query(args);
    if (query.empty()) {
        return fail(ErrorKind::LookupFailed, "step names no target");
    }
    return with_timeout<ControlRef>(timeout_of(args), [&] { return resolve_classic(query); });
}

std::expected<void, Error> MacroEngine::click_control(const ControlRef& control) {
    auto clicked = control->click();
    if (clicked) return clicked;

    auto rect = control->rectangle();
    if (!rect || rect->empty()) {
        return fail(ErrorKind::InjectionFailure,
                    "control has no action and no rectangle: " + clicked.error().message);
    }
    log(std::format("no click action, clicking centre ({}, {})", rect->center_x(), rect->center_y()));
    return gesture::click_at(input_, rect->center_x(), rect->center_y(), config_.click_dwell, sleep_);
}

std::expected<StepOutcome, Error> MacroEngine::do_click(const json& args) {
    auto control = resolve_target(args);
    if (control) {
        if (auto res = click_control(*control); !res) return std::unexpected(res.error());
        return StepOutcome::Done;
    }

    if (control.error().kind == ErrorKind::InvalidMacro || control.error().kind == ErrorKind::InvalidSelector) {
        return std::unexpected(control.error());
    }

    auto point = coordinates(args);
    if (!point) return std::unexpected(control.error());

    std::println(stderr, "[handsfree] click degraded to coordinates ({}, {}): {}", point->first,
                 point->second, describe(control.error()));
    auto res = gesture::click_at(input_, point->first, point->second, config_.click_dwell, sleep_);
    if (!res) return std::unexpected(res.error());
    return StepOutcome::Degraded;
}

std::expected<StepOutcome, Error> MacroEngine::do_type(const json& args) {
    auto text = string_arg(args, "text");
    bool enter = bool_arg(args, "enter", false);

    auto selectors = step_selectors(args);
    if (!selectors) return std::unexpected(selectors.error());

    if (selectors->empty() && classic_query(args).empty()) {
        // Recorded after a coordinates-only click: the target already has focus.
        if (!text.empty()) {
            if (auto res = input_.type_text(text); !res) return std::unexpected(res.error());
        }
    } else {
        auto control = resolve_target(args);
        if (!control) return std::unexpected(control.error());

        if (auto set = (*control)->set_text(text); !set) {
            log("not editable, typing through the keyboard: " + set.error().message);
            if (auto res = click_control(*control); !res) return std::unexpected(res.error());
            if (!text.empty()) {
                if (auto res = input_.type_text(text); !res) return std::unexpected(res.error());
            }
        }
    }

    if (enter) {
        if (auto res = input_.press_enter(); !res) return std::unexpected(res.error());
    }
    return StepOutcome::Done;
}

std::expected<StepOutcome, Error> MacroEngine::do_sleep(const json& args) {
    double seconds = 1.0;
    if (auto it = args.find("seconds"); it != args.end()) {
        if (!it->is_number()) return fail(ErrorKind::InvalidMacro, "sleep: seconds must be a number");
        seconds = it->get<double>();
    }
    auto ms = clamp_to(seconds * 1000.0, 0, MAX_SLEEP_MS);
    if (ms > 0) sleep_(std::chrono::milliseconds(ms));
    return StepOutcome::Done;
}

std::expected<StepOutcome, Error> MacroEngine::do_start_app(const json& args) {
    auto command = string_arg(args, "command");
    if (command.empty()) return fail(ErrorKind::InvalidMacro, "start-app: missing 'command'");

    if (auto res = wm_.launch(command); !res) return std::unexpected(res.error());
    log("launched: " + command);

    WindowDescriptor wait{
        .title = string_arg(args, "title"),
        .title_regex = string_arg(args, "title_regex"),
    };
    if (wait.empty()) return StepOutcome::Done;

    auto window = with_timeout<WindowInfo>(timeout_of(args), [&] { return locator_.locate_and_focus(wait); });
    if (!window) return std::unexpected(window.error());

    current_window_ = std::move(*window);
    return StepOutcome::Done;
}

std::expected<StepOutcome, Error> MacroEngine::do_drag(const json& args) {
    auto sx = int_arg(args, "start_x");
    auto sy = int_arg(args, "start_y");
    auto ex = int_arg(args, "end_x");
    auto ey = int_arg(args, "end_y");
    for (const auto* v : {&sx, &sy, &ex, &ey}) {
        if (!*v) return std::unexpected(v->error());
    }

    gesture::DragOptions options;
    options.duration_ms = int_arg(args, "duration_ms", options.duration_ms);
    options.steps = int_arg(args, "steps", options.steps);
    options.pre_hold_ms = int_arg(args, "pre_hold_ms", options.pre_hold_ms);
    options.post_hold_ms = int_arg(args, "post_hold_ms", options.post_hold_ms);

    auto res = gesture::drag(input_, *sx, *sy, *ex, *ey, options, sleep_);
    if (!res) return std::unexpected(res.error());
    return StepOutcome::Done;
}

std::expected<StepOutcome, Error> MacroEngine::do_browser(Action action, const json& args) {
    if (!browser_) {
        return fail(ErrorKind::BrowserFailure, std::string(action_name(action)) + ": no browser available");
    }

    switch (action) {
        case Action::BrowserOpen: {
            auto url = string_arg(args, "url");
            if (url.empty()) return fail(ErrorKind::InvalidMacro, "browser-open: missing 'url'");
            auto page = browser_->open(url, string_arg(args, "browser"), bool_arg(args, "headless", false));
            if (!page) return std::unexpected(page.error());
            log(std::format("opened {} ({})", page->url, page->title));
            return StepOutcome::Done;
        }
        case Action::BrowserNavigate: {
            auto url = string_arg(args, "url");
            if (url.empty()) return fail(ErrorKind::InvalidMacro, "browser-navigate: missing 'url'");
            auto page = browser_->navigate(url);
            if (!page) return std::unexpected(page.error());
            log(std::format("navigated to {} ({})", page->url, page->title));
            return StepOutcome::Done;
        }
        case Action::BrowserClick: {
            auto css = string_arg(args, "selector");
            auto text = string_arg(args, "text");
            if (css.empty() && text.empty()) {
                return fail(ErrorKind::InvalidMacro, "browser-click: provide 'selector' or 'text'");
            }
            auto res = with_timeout<void>(timeout_of(args), [&] {
                return browser_->click(css, text, bool_arg(args, "exact", false));
            });
            if (!res) return std::unexpected(res.error());
            return StepOutcome::Done;
        }
        case Action::BrowserType: {
            auto css = string_arg(args, "selector");
            if (css.empty()) return fail(ErrorKind::InvalidMacro, "browser-type: missing 'selector'");
            auto res = with_timeout<void>(timeout_of(args), [&] {
                return browser_->type(css, string_arg(args, "text"), bool_arg(args, "clear", true),
                                      bool_arg(args, "enter", false));
            });
            if (!res) return std::unexpected(res.error());
            return StepOutcome::Done;
        }
        case Action::BrowserEval: {
            auto script = string_arg(args, "script");
            if (script.empty()) return fail(ErrorKind::InvalidMacro, "browser-eval: missing 'script'");
            auto result = browser_->evaluate(script);
            if (!result) return std::unexpected(result.error());
            log("eval result: " + result->dump());
            return StepOutcome::Done;
        }
        default:
            break;
    }
    return fail(ErrorKind::UnknownAction, std::string(action_name(action)) + " is not a browser action");
}
