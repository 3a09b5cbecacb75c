#pragma once

#include "error.hpp"

#include <chrono>
#include <cstdint>
#include <curl/curl.h>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Chrome DevTools Protocol over the browser's remote debugging port: the
// HTTP discovery endpoints plus one websocket session to a page target.
class DevToolsClient {
public:
    explicit DevToolsClient(uint16_t port);
    ~DevToolsClient();

    DevToolsClient(const DevToolsClient&) = delete;
    DevToolsClient& operator=(const DevToolsClient&) = delete;

    // GET http://127.0.0.1:<port><path>, parsed as JSON.
    std::expected<nlohmann::json, Error> http_get(const std::string& path);

    // Attaches to the first page target, creating one when none exists.
    std::expected<void, Error> attach();
    bool attached() const { return ws_ != nullptr; }
    void detach();

    // Sends a command and waits for its reply; events in between are dropped.
    std::expected<nlohmann::json, Error> call(const std::string& method,
                                              const nlohmann::json& params = nlohmann::json::object(),
                                              std::chrono::milliseconds timeout = std::chrono::seconds(30));

private:
    std::expected<void, Error> send_text(const std::string& text);
    std::expected<std::string, Error> recv_message(std::chrono::steady_clock::time_point deadline);
    // Polls the websocket for `events` (POLLIN, POLLOUT); false on timeout.
    bool wait_socket(short events, std::chrono::milliseconds timeout);

    static constexpr std::chrono::milliseconds SEND_TIMEOUT{10000};

    uint16_t port_;
    CURL* ws_ = nullptr;
    int64_t next_id_ = 1;
};
