#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("replay")) {
            auto& r = j["replay"];
            if (r.contains("delay_cap_ms")) cfg.replay.delay_cap_ms = r["delay_cap_ms"].get<uint32_t>();
            if (r.contains("default_timeout_s")) cfg.replay.default_timeout_s = r["default_timeout_s"].get<uint32_t>();
            if (r.contains("poll_interval_ms")) cfg.replay.poll_interval_ms = r["poll_interval_ms"].get<uint32_t>();
        }

        if (j.contains("recorder")) {
            auto& r = j["recorder"];
            if (r.contains("idle_flush_ms")) cfg.recorder.idle_flush_ms = r["idle_flush_ms"].get<uint32_t>();
            if (r.contains("idle_poll_ms")) cfg.recorder.idle_poll_ms = r["idle_poll_ms"].get<uint32_t>();
            if (r.contains("stop_key")) cfg.recorder.stop_key = r["stop_key"].get<std::string>();
            if (r.contains("step_timeout_s")) cfg.recorder.step_timeout_s = r["step_timeout_s"].get<uint32_t>();
            if (r.contains("screen_width")) cfg.recorder.screen_width = r["screen_width"].get<int>();
            if (r.contains("screen_height")) cfg.recorder.screen_height = r["screen_height"].get<int>();
        }

        if (j.contains("resolver")) {
            auto& r = j["resolver"];
            if (r.contains("max_ancestor_hops")) cfg.resolver.max_ancestor_hops = r["max_ancestor_hops"].get<uint32_t>();
            if (r.contains("max_search_nodes")) cfg.resolver.max_search_nodes = r["max_search_nodes"].get<uint32_t>();
        }

        if (j.contains("input")) {
            auto& i = j["input"];
            if (i.contains("seat")) cfg.input.seat = i["seat"].get<std::string>();
            if (i.contains("click_dwell_ms")) cfg.input.click_dwell_ms = i["click_dwell_ms"].get<uint32_t>();
        }

        if (j.contains("browser")) {
            auto& b = j["browser"];
            if (b.contains("executable")) cfg.browser.executable = b["executable"].get<std::string>();
            if (b.contains("debug_port")) cfg.browser.debug_port = b["debug_port"].get<uint16_t>();
            if (b.contains("headless")) cfg.browser.headless = b["headless"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
