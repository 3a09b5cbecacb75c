#pragma once

#include "browser/browser_state.hpp"
#include "browser/devtools_client.hpp"
#include "platform/browser.hpp"

#include <chrono>
#include <cstdint>
#include <string>

// BrowserEngine driving a Chromium-family browser over the DevTools
// protocol. The browser runs with a persistent profile so logins survive
// between runs; the last URL is kept in a state file.
class DevToolsBrowser : public BrowserEngine {
public:
    struct Options {
        std::string executable = "chromium";
        uint16_t debug_port = 9222;
        bool headless = false;
        std::string state_path;
        std::string profile_dir;
        std::chrono::milliseconds load_timeout{15000};
    };

    explicit DevToolsBrowser(Options options, bool verbose = false);

    std::expected<PageInfo, Error> open(const std::string& url, const std::string& browser,
                                        bool headless) override;
    std::expected<PageInfo, Error> navigate(const std::string& url) override;
    std::expected<void, Error> click(const std::string& selector, const std::string& text,
                                     bool exact) override;
    std::expected<void, Error> type(const std::string& selector, const std::string& text,
                                    bool clear, bool enter) override;
    std::expected<nlohmann::json, Error> evaluate(const std::string& script) override;

private:
    // Starts the browser unless its debugging port already answers.
    std::expected<void, Error> ensure_running(const std::string& executable, bool headless);
    // Running browser showing the last known page.
    std::expected<void, Error> ensure_page();
    std::expected<PageInfo, Error> wait_loaded();
    std::expected<nlohmann::json, Error> eval_value(const std::string& expression);
    void remember(const PageInfo& page);
    void log(const std::string& msg);

    Options options_;
    bool verbose_;
    DevToolsClient client_;
    BrowserState state_;
};
