#include "browser/devtools_browser.hpp"
#include "config.hpp"
#include "macro/engine.hpp"
#include "macro/macro_step.hpp"
#include "platform/linux/atspi_engine.hpp"
#include "platform/linux/evdev_input_source.hpp"
#include "platform/linux/keymap.hpp"
#include "platform/linux/sway_input_injector.hpp"
#include "platform/linux/sway_window_manager.hpp"
#include "platform/platform_paths.hpp"
#include "recorder/recorder.hpp"
#include "selector/builder.hpp"
#include "selector/point_lookup.hpp"
#include "selector/resolver.hpp"
#include "selector/selector.hpp"
#include "storage/run_history.hpp"
#include "sway/ipc.hpp"
#include "window_locator.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <print>
#include <signal.h>
#include <sstream>
#include <string>
#include <sys/signalfd.h>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <command> [args]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  run <macro.json>          Replay a macro");
    std::println(stderr, "  record <out.json>         Record clicks and typing until the stop key");
    std::println(stderr, "  resolve <selector.json>   Resolve a selector against the live desktop");
    std::println(stderr, "  inspect X Y               Print the selector for the control at a point");
    std::println(stderr, "  history [--limit N]       Show recent runs");
    std::println(stderr, "Options:");
    std::println(stderr, "  -v, --verbose       Enable verbose logging");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "  -h, --help          Show this help");
}

static std::string history_path() {
    return platform::data_dir() + "/history.db";
}

static void save_history(const RunRecord& record, bool verbose) {
    RunHistory history;
    if (!history.open(history_path())) return;
    if (!history.insert(record) && verbose) {
        std::println(stderr, "[handsfree] history not recorded");
    }
}

static double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

static bool connect_desktop(SwayIpc& ipc, AtspiEngine& a11y) {
    if (!ipc.connect()) {
        std::println(stderr, "Failed to connect to sway; is this a sway session?");
        return false;
    }
    if (!a11y.init()) {
        std::println(stderr, "Failed to connect to the accessibility bus");
        return false;
    }
    return true;
}

static int cmd_run(const Config& config, const std::string& path, bool verbose) {
    auto steps = macro::load(path);
    if (!steps) {
        std::println(stderr, "{}: {}", path, describe(steps.error()));
        return 2;
    }

    SwayIpc ipc;
    AtspiEngine a11y;
    if (!connect_desktop(ipc, a11y)) return 1;

    SwayWindowManager wm(ipc);
    SwayInputInjector input(ipc, config.input.seat);
    DevToolsBrowser browser(
        DevToolsBrowser::Options{
            .executable = config.browser.executable,
            .debug_port = config.browser.debug_port,
            .headless = config.browser.headless,
            .state_path = platform::data_dir() + "/browser-state.json",
            .profile_dir = platform::data_dir() + "/browser-profile",
        },
        verbose);

    MacroEngine engine(
        EngineConfig{
            .delay_cap = std::chrono::milliseconds(config.replay.delay_cap_ms),
            .poll_interval = std::chrono::milliseconds(config.replay.poll_interval_ms),
            .click_dwell = std::chrono::milliseconds(config.input.click_dwell_ms),
            .default_timeout_s = static_cast<int>(config.replay.default_timeout_s),
            .max_search_nodes = config.resolver.max_search_nodes,
        },
        wm, a11y, input, &browser, verbose);

    auto start = std::chrono::steady_clock::now();
    auto result = engine.run(*steps);

    RunRecord record{
        .kind = "run",
        .macro_path = path,
        .steps_total = static_cast<int64_t>(steps->size()),
    };
    record.duration = seconds_since(start);

    if (!result) {
        const auto& f = result.error();
        record.steps_executed = static_cast<int64_t>(f.step_index);
        record.failed_step = static_cast<int64_t>(f.step_index);
        record.error = describe(f.error);
        save_history(record, verbose);

        std::println(stderr, "Step {} ({}) failed: {}", f.step_index + 1, f.action, describe(f.error));
        return 1;
    }

    record.steps_executed = static_cast<int64_t>(result->steps_executed);
    record.degraded = static_cast<int64_t>(result->degraded);
    save_history(record, verbose);

    if (result->degraded > 0) {
        std::println("Done: {} steps ({} by coordinates)", result->steps_executed, result->degraded);
    } else {
        std::println("Done: {} steps", result->steps_executed);
    }
    return 0;
}

static int cmd_record(const Config& config, const std::string& out, bool verbose) {
    auto stop_code = keymap::key_code(config.recorder.stop_key);
    if (!stop_code) {
        std::println(stderr, "Unknown stop key: {}", config.recorder.stop_key);
        return 2;
    }

    // Blocked before any thread starts so every thread inherits the mask.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);

    int signal_fd = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return 1;
    }

    SwayIpc ipc;
    AtspiEngine a11y;
    if (!connect_desktop(ipc, a11y)) {
        ::close(signal_fd);
        return 1;
    }

    EvdevPointerSource pointer(config.recorder.screen_width, config.recorder.screen_height);
    EvdevKeySource keys(*stop_code);

    // Put the real cursor where the tracker believes it is.
    SwayInputInjector input(ipc, config.input.seat);
    int cx = config.recorder.screen_width / 2;
    int cy = config.recorder.screen_height / 2;
    if (auto res = input.move_to(cx, cy); res) {
        pointer.sync(cx, cy);
    } else if (verbose) {
        std::println(stderr, "[handsfree] cursor not synced: {}", describe(res.error()));
    }

    SelectorBuilder builder(config.resolver.max_ancestor_hops);
    auto lookup = [&](int x, int y) -> std::optional<Selector> {
        auto sel = selector_at(a11y, builder, x, y);
        if (!sel) {
            if (verbose) std::println(stderr, "[handsfree] no selector at ({}, {}): {}", x, y, describe(sel.error()));
            return std::nullopt;
        }
        return std::move(*sel);
    };

    Recorder recorder(pointer, keys, lookup,
                      Recorder::Options{
                          .idle_poll = std::chrono::milliseconds(config.recorder.idle_poll_ms),
                          .session = {
                              .step_timeout_s = config.recorder.step_timeout_s,
                              .idle_flush = std::chrono::milliseconds(config.recorder.idle_flush_ms),
                          },
                      },
                      verbose);

    if (!recorder.start()) {
        ::close(signal_fd);
        return 1;
    }

    std::jthread signal_watcher([&](std::stop_token st) {
        pollfd pfd{.fd = signal_fd, .events = POLLIN, .revents = 0};
        while (!st.stop_requested()) {
            if (::poll(&pfd, 1, 200) <= 0) continue;
            signalfd_siginfo info;
            if (::read(signal_fd, &info, sizeof(info)) == sizeof(info)) {
                recorder.request_stop();
                return;
            }
        }
    });

    std::println("Recording. Press {} or Ctrl+C to stop.", config.recorder.stop_key);
    auto start = std::chrono::steady_clock::now();
    auto steps = recorder.wait();

    signal_watcher.request_stop();
    signal_watcher.join();
    ::close(signal_fd);

    RunRecord record{
        .kind = "record",
        .macro_path = out,
        .steps_total = static_cast<int64_t>(steps.size()),
        .steps_executed = static_cast<int64_t>(steps.size()),
    };
    record.duration = seconds_since(start);

    if (auto res = macro::save(out, steps); !res) {
        record.error = describe(res.error());
        save_history(record, verbose);
        std::println(stderr, "{}", describe(res.error()));
        return 1;
    }
    save_history(record, verbose);

    std::println("Saved {} steps to {}", steps.size(), out);
    return 0;
}

static int cmd_resolve(const Config& config, const std::string& path, bool verbose) {
    std::ifstream file(path);
    if (!file) {
        std::println(stderr, "Cannot read {}", path);
        return 2;
    }
    std::stringstream ss;
    ss << file.rdbuf();

    auto sel = selector::parse(ss.str());
    if (!sel) {
        std::println(stderr, "{}: {}", path, describe(sel.error()));
        return 2;
    }

    SwayIpc ipc;
    AtspiEngine a11y;
    if (!connect_desktop(ipc, a11y)) return 1;

    SwayWindowManager wm(ipc);
    WindowLocator locator(wm);

    WindowInfo window;
    if (sel->window.empty()) {
        window = wm.get_focused_window();
        if (window.empty()) {
            std::println(stderr, "{}", describe({ErrorKind::NoActiveWindow, "selector names no window and none is focused"}));
            return 1;
        }
    } else {
        auto located = locator.locate_and_focus(sel->window);
        if (!located) {
            std::println(stderr, "{}", describe(located.error()));
            return 1;
        }
        window = std::move(*located);
    }

    auto root = a11y.window_root(window);
    if (!root) {
        std::println(stderr, "{}", describe(root.error()));
        return 1;
    }

    SelectorResolver resolver(config.resolver.max_search_nodes);
    auto res = resolver.resolve(*root, *sel);
    if (!res) {
        std::println(stderr, "{}", describe(res.error()));
        return 1;
    }

    auto attrs = res->control->attributes();
    json out = {
        {"window", window.title},
        {"candidate_index", res->candidate_index},
        {"attempts", res->attempts},
        {"control_type", attrs.control_type},
        {"name", attrs.name},
        {"stable_id", attrs.stable_id},
    };
    if (auto rect = res->control->rectangle()) {
        out["rect"] = {{"x", rect->x}, {"y", rect->y}, {"width", rect->width}, {"height", rect->height}};
    } else if (verbose) {
        std::println(stderr, "[handsfree] no rectangle: {}", rect.error().message);
    }
    std::println("{}", out.dump(2));
    return 0;
}

static int cmd_inspect(const Config& config, int x, int y) {
    AtspiEngine a11y;
    if (!a11y.init()) {
        std::println(stderr, "Failed to connect to the accessibility bus");
        return 1;
    }

    SelectorBuilder builder(config.resolver.max_ancestor_hops);
    auto sel = selector_at(a11y, builder, x, y);
    if (!sel) {
        std::println(stderr, "{}", describe(sel.error()));
        return 1;
    }
    std::println("{}", selector::encode(*sel).dump(2));
    return 0;
}

static int cmd_history(int limit) {
    RunHistory history;
    if (!history.open(history_path())) return 1;

    auto entries = history.recent(limit);
    if (entries.empty()) {
        std::println("No history.");
        return 0;
    }

    for (const auto& e : entries) {
        const auto& r = e.record;
        std::print("[{}] {} {}: {}/{} steps", e.timestamp, r.kind, r.macro_path, r.steps_executed, r.steps_total);
        if (r.degraded > 0) std::print(", {} by coordinates", r.degraded);
        if (r.failed_step) std::print(", failed at step {}: {}", *r.failed_step + 1, r.error);
        std::println(" ({:.1f}s)", r.duration);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::vector<std::string> args;
    int limit = 10;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        usage(argv[0]);
        return 1;
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    const auto& command = args[0];
    if (command == "run" && args.size() == 2) return cmd_run(config, args[1], verbose);
    if (command == "record" && args.size() == 2) return cmd_record(config, args[1], verbose);
    if (command == "resolve" && args.size() == 2) return cmd_resolve(config, args[1], verbose);
    if (command == "inspect" && args.size() == 3) {
        return cmd_inspect(config, std::atoi(args[1].c_str()), std::atoi(args[2].c_str()));
    }
    if (command == "history") return cmd_history(limit);

    std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 1;
}
