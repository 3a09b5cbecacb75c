#include "browser/devtools_browser.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <print>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

constexpr const char* CLICK_SCRIPT = R"JS((() => {
  const css = %CSS%, want = %TEXT%.trim(), exact = %EXACT%;
  let el = null;
  if (css) {
    el = document.querySelector(css);
  } else {
    let best = Infinity;
    for (const e of document.querySelectorAll('a,button,input,label,[role],span,div,li,td')) {
      const t = (e.innerText || e.value || '').trim();
      if (exact ? t !== want : !t.includes(want)) continue;
      if (t.length < best) { best = t.length; el = e; }
    }
  }
  if (!el) return false;
  el.scrollIntoView({block: 'center'});
  el.click();
  return true;
})())JS";

constexpr const char* FOCUS_SCRIPT = R"JS((() => {
  const el = document.querySelector(%CSS%);
  if (!el) return false;
  el.scrollIntoView({block: 'center'});
  el.focus();
  if (%CLEAR%) {
    if ('value' in el) el.value = '';
    else if (el.isContentEditable) el.textContent = '';
    el.dispatchEvent(new Event('input', {bubbles: true}));
  }
  return true;
})())JS";

std::string fill(std::string script, std::string_view key, const std::string& value) {
    for (auto pos = script.find(key); pos != std::string::npos; pos = script.find(key, pos + value.size())) {
        script.replace(pos, key.size(), value);
    }
    return script;
}

// JSON string literals are valid JavaScript string literals.
std::string js_string(const std::string& s) {
    return json(s).dump();
}

} // namespace

DevToolsBrowser::DevToolsBrowser(Options options, bool verbose)
    : options_(std::move(options))
    , verbose_(verbose)
    , client_(options_.debug_port)
    , state_(BrowserState::load(options_.state_path)) {}

void DevToolsBrowser::log(const std::string& msg) {
    if (verbose_) std::println(stderr, "[handsfree] browser: {}", msg);
}

std::expected<void, Error> DevToolsBrowser::ensure_running(const std::string& executable, bool headless) {
    if (client_.http_get("/json/version")) return {};

    if (executable == "firefox") {
        return fail(ErrorKind::BrowserFailure, "firefox does not speak the DevTools protocol; use a Chromium browser");
    }

    std::vector<std::string> argv = {
        executable,
        std::format("--remote-debugging-port={}", options_.debug_port),
        "--no-first-run",
        "--no-default-browser-check",
    };
    if (!options_.profile_dir.empty()) argv.push_back("--user-data-dir=" + options_.profile_dir);
    if (headless) argv.push_back("--headless=new");
    else argv.push_back("--start-maximized");

    std::vector<char*> args;
    for (auto& a : argv) args.push_back(a.data());
    args.push_back(nullptr);

    log("launching " + executable);

    // Double fork so the browser outlives us without leaving a zombie.
    pid_t pid = ::fork();
    if (pid < 0) {
        return fail(ErrorKind::BrowserFailure, std::string("fork() failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        ::setsid();
        if (::fork() != 0) ::_exit(0);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return fail(ErrorKind::BrowserFailure, std::string("waitpid() failed: ") + std::strerror(errno));
    }

    auto deadline = std::chrono::steady_clock::now() + options_.load_timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(250ms);
        if (client_.http_get("/json/version")) return {};
    }
    return fail(ErrorKind::BrowserFailure,
                std::format("{} did not open debugging port {}", executable, options_.debug_port));
}

std::expected<void, Error> DevToolsBrowser::ensure_page() {
    auto exe = state_.browser == "chromium" ? options_.executable : state_.browser;
    if (auto res = ensure_running(exe, options_.headless); !res) return res;
    if (state_.url.empty()) return {};

    auto href = eval_value("location.href");
    if (!href) return std::unexpected(href.error());
    if (href->is_string() && href->get<std::string>() != "about:blank") return {};

    auto page = navigate(state_.url);
    if (!page) return std::unexpected(page.error());
    return {};
}

std::expected<PageInfo, Error> DevToolsBrowser::open(const std::string& url, const std::string& browser,
                                                     bool headless) {
    if (!browser.empty()) state_.browser = browser;
    auto exe = state_.browser == "chromium" ? options_.executable : state_.browser;
    if (auto res = ensure_running(exe, headless || options_.headless); !res) return std::unexpected(res.error());
    return navigate(url);
}

std::expected<PageInfo, Error> DevToolsBrowser::navigate(const std::string& url) {
    auto exe = state_.browser == "chromium" ? options_.executable : state_.browser;
    if (auto res = ensure_running(exe, options_.headless); !res) return std::unexpected(res.error());

    auto nav = client_.call("Page.navigate", {{"url", url}});
    if (!nav) return std::unexpected(nav.error());
    if (auto err = nav->value("errorText", ""); !err.empty()) {
        return fail(ErrorKind::BrowserFailure, "navigate to " + url + ": " + err);
    }

    std::this_thread::sleep_for(200ms);
    auto page = wait_loaded();
    if (!page) return page;

    remember(*page);
    return page;
}

std::expected<void, Error> DevToolsBrowser::click(const std::string& selector, const std::string& text,
                                                  bool exact) {
    if (auto res = ensure_page(); !res) return res;

    auto script = fill(CLICK_SCRIPT, "%CSS%", js_string(selector));
    script = fill(script, "%TEXT%", js_string(text));
    script = fill(script, "%EXACT%", exact ? "true" : "false");

    auto clicked = eval_value(script);
    if (!clicked) return std::unexpected(clicked.error());
    if (!clicked->is_boolean() || !clicked->get<bool>()) {
        return fail(ErrorKind::LookupFailed,
                    selector.empty() ? "no element with text '" + text + "'" : "no element matches " + selector);
    }

    // A click may navigate; keep the state on the page we end up on.
    if (auto page = wait_loaded()) remember(*page);
    return {};
}

std::expected<void, Error> DevToolsBrowser::type(const std::string& selector, const std::string& text,
                                                 bool clear, bool enter) {
    if (auto res = ensure_page(); !res) return res;

    auto script = fill(FOCUS_SCRIPT, "%CSS%", js_string(selector));
    script = fill(script, "%CLEAR%", clear ? "true" : "false");

    auto focused = eval_value(script);
    if (!focused) return std::unexpected(focused.error());
    if (!focused->is_boolean() || !focused->get<bool>()) {
        return fail(ErrorKind::LookupFailed, "no element matches " + selector);
    }

    if (!text.empty()) {
        auto res = client_.call("Input.insertText", {{"text", text}});
        if (!res) return std::unexpected(res.error());
    }

    if (enter) {
        json key = {{"key", "Enter"}, {"code", "Enter"}, {"windowsVirtualKeyCode", 13}};
        json down = key;
        down["type"] = "keyDown";
        down["text"] = "\r";
        json up = key;
        up["type"] = "keyUp";
        if (auto res = client_.call("Input.dispatchKeyEvent", down); !res) return std::unexpected(res.error());
        if (auto res = client_.call("Input.dispatchKeyEvent", up); !res) return std::unexpected(res.error());
        if (auto page = wait_loaded()) remember(*page);
    }
    return {};
}

std::expected<json, Error> DevToolsBrowser::evaluate(const std::string& script) {
    if (auto res = ensure_page(); !res) return std::unexpected(res.error());
    return eval_value(script);
}

std::expected<json, Error> DevToolsBrowser::eval_value(const std::string& expression) {
    auto res = client_.call("Runtime.evaluate", {
        {"expression", expression},
        {"returnByValue", true},
        {"awaitPromise", true},
    });
    if (!res) return std::unexpected(res.error());

    if (res->contains("exceptionDetails")) {
        const auto& details = (*res)["exceptionDetails"];
        std::string what = details.value("text", "exception");
        if (details.contains("exception")) what = details["exception"].value("description", what);
        return fail(ErrorKind::BrowserFailure, "script threw: " + what);
    }
    const auto& result = res->value("result", json::object());
    return result.value("value", json());
}

std::expected<PageInfo, Error> DevToolsBrowser::wait_loaded() {
    auto deadline = std::chrono::steady_clock::now() + options_.load_timeout;
    for (;;) {
        auto ready = eval_value("document.readyState");
        if (!ready) return std::unexpected(ready.error());
        if (ready->is_string() && ready->get<std::string>() != "loading") break;
        if (std::chrono::steady_clock::now() >= deadline) {
            return fail(ErrorKind::BrowserFailure, "page did not finish loading");
        }
        std::this_thread::sleep_for(100ms);
    }

    auto info = eval_value("({url: location.href, title: document.title})");
    if (!info) return std::unexpected(info.error());
    return PageInfo{
        .url = info->value("url", ""),
        .title = info->value("title", ""),
    };
}

void DevToolsBrowser::remember(const PageInfo& page) {
    state_.url = page.url;
    if (options_.state_path.empty()) return;
    if (auto res = state_.save(options_.state_path); !res) {
        std::println(stderr, "browser: cannot save state: {}", res.error().message);
    }
}
