#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Replay {
        uint32_t delay_cap_ms = 5000;
        uint32_t default_timeout_s = 20;
        uint32_t poll_interval_ms = 500;
    } replay;

    struct Recorder {
        uint32_t idle_flush_ms = 1500;
        uint32_t idle_poll_ms = 250;
        std::string stop_key = "F9";
        uint32_t step_timeout_s = 20;  // "timeout" written into recorded steps
        // Pointer position is integrated from relative motion, clamped to this area.
        int screen_width = 1920;
        int screen_height = 1080;
    } recorder;

    struct Resolver {
        uint32_t max_ancestor_hops = 256;
        uint32_t max_search_nodes = 5000;
    } resolver;

    struct Input {
        std::string seat = "seat0";
        uint32_t click_dwell_ms = 50;
    } input;

    struct Browser {
        std::string executable = "chromium";
        uint16_t debug_port = 9222;
        bool headless = false;
    } browser;

    static Config load(const std::string& path);
    static Config load_default();
};
