#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "platform/platform_paths.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "hf_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(fd >= 0);
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.replay.delay_cap_ms == 5000);
        REQUIRE(cfg.replay.default_timeout_s == 20);
        REQUIRE(cfg.replay.poll_interval_ms == 500);
        REQUIRE(cfg.recorder.idle_flush_ms == 1500);
        REQUIRE(cfg.recorder.idle_poll_ms == 250);
        REQUIRE(cfg.recorder.stop_key == "F9");
        REQUIRE(cfg.resolver.max_ancestor_hops == 256);
        REQUIRE(cfg.input.seat == "seat0");
        REQUIRE(cfg.browser.executable == "chromium");
        REQUIRE(cfg.browser.debug_port == 9222);
        REQUIRE_FALSE(cfg.browser.headless);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "replay": { "delay_cap_ms": 1000, "default_timeout_s": 5, "poll_interval_ms": 100 },
            "recorder": { "idle_flush_ms": 900, "idle_poll_ms": 50, "stop_key": "F12",
                          "step_timeout_s": 7, "screen_width": 2560, "screen_height": 1440 },
            "resolver": { "max_ancestor_hops": 64, "max_search_nodes": 100 },
            "input": { "seat": "seat1", "click_dwell_ms": 10 },
            "browser": { "executable": "google-chrome", "debug_port": 9333, "headless": true }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.replay.delay_cap_ms == 1000);
        REQUIRE(cfg.replay.default_timeout_s == 5);
        REQUIRE(cfg.replay.poll_interval_ms == 100);
        REQUIRE(cfg.recorder.idle_flush_ms == 900);
        REQUIRE(cfg.recorder.idle_poll_ms == 50);
        REQUIRE(cfg.recorder.stop_key == "F12");
        REQUIRE(cfg.recorder.step_timeout_s == 7);
        REQUIRE(cfg.recorder.screen_width == 2560);
        REQUIRE(cfg.recorder.screen_height == 1440);
        REQUIRE(cfg.resolver.max_ancestor_hops == 64);
        REQUIRE(cfg.resolver.max_search_nodes == 100);
        REQUIRE(cfg.input.seat == "seat1");
        REQUIRE(cfg.input.click_dwell_ms == 10);
        REQUIRE(cfg.browser.executable == "google-chrome");
        REQUIRE(cfg.browser.debug_port == 9333);
        REQUIRE(cfg.browser.headless);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "replay": { "delay_cap_ms": 250 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.replay.delay_cap_ms == 250);
        // Other fields retain defaults
        REQUIRE(cfg.replay.default_timeout_s == 20);
        REQUIRE(cfg.recorder.stop_key == "F9");
        REQUIRE(cfg.browser.debug_port == 9222);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.replay.delay_cap_ms == 5000);
        REQUIRE(cfg.recorder.idle_flush_ms == 1500);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/hf_test_nonexistent_config_file.json");
        REQUIRE(cfg.replay.delay_cap_ms == 5000);
        REQUIRE(cfg.input.seat == "seat0");
    }
}

TEST_CASE("PlatformPaths", "[config]") {
    // setenv/unsetenv touch the process environment; restore what was there.
    struct SavedEnv {
        std::string name;
        std::optional<std::string> value;
        explicit SavedEnv(std::string n) : name(std::move(n)) {
            if (const char* v = std::getenv(name.c_str())) value = v;
        }
        ~SavedEnv() {
            if (value) setenv(name.c_str(), value->c_str(), 1);
            else unsetenv(name.c_str());
        }
    };
    SavedEnv xdg_config("XDG_CONFIG_HOME");
    SavedEnv xdg_data("XDG_DATA_HOME");
    SavedEnv home("HOME");

    SECTION("XdgWins") {
        setenv("XDG_CONFIG_HOME", "/x/config", 1);
        setenv("XDG_DATA_HOME", "/x/data", 1);
        REQUIRE(platform::config_dir() == "/x/config/handsfree");
        REQUIRE(platform::data_dir() == "/x/data/handsfree");
    }

    SECTION("EmptyXdgFallsBackToHome") {
        setenv("XDG_CONFIG_HOME", "", 1);
        unsetenv("XDG_DATA_HOME");
        setenv("HOME", "/home/ada", 1);
        REQUIRE(platform::config_dir() == "/home/ada/.config/handsfree");
        REQUIRE(platform::data_dir() == "/home/ada/.local/share/handsfree");
    }

    SECTION("NoHome") {
        unsetenv("XDG_CONFIG_HOME");
        unsetenv("HOME");
        REQUIRE(platform::config_dir().empty());
    }
}
