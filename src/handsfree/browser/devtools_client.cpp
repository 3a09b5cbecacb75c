#include "browser/devtools_client.hpp"

#include <format>
#include <poll.h>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

DevToolsClient::DevToolsClient(uint16_t port)
    : port_(port) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

DevToolsClient::~DevToolsClient() {
    detach();
    curl_global_cleanup();
}

std::expected<json, Error> DevToolsClient::http_get(const std::string& path) {
    CURL* curl = curl_easy_init();
    if (!curl) return fail(ErrorKind::BrowserFailure, "curl_easy_init failed");

    auto url = std::format("http://127.0.0.1:{}{}", port_, path);
    std::string body;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 5L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 2L);
    // /json/new requires PUT on current Chromium.
    if (path.starts_with("/json/new")) curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return fail(ErrorKind::BrowserFailure, std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (status != 200) {
        return fail(ErrorKind::BrowserFailure, std::format("{} returned HTTP {}", path, status));
    }

    try {
        return json::parse(body);
    } catch (const json::exception& e) {
        return fail(ErrorKind::BrowserFailure, std::string("bad DevTools reply: ") + e.what());
    }
}

std::expected<void, Error> DevToolsClient::attach() {
    if (ws_) return {};

    auto targets = http_get("/json/list");
    if (!targets) return std::unexpected(targets.error());

    std::string ws_url;
    for (const auto& t : *targets) {
        if (t.value("type", "") == "page" && t.contains("webSocketDebuggerUrl")) {
            ws_url = t["webSocketDebuggerUrl"].get<std::string>();
            break;
        }
    }
    if (ws_url.empty()) {
        auto created = http_get("/json/new?about:blank");
        if (!created) return std::unexpected(created.error());
        ws_url = created->value("webSocketDebuggerUrl", "");
    }
    if (ws_url.empty()) return fail(ErrorKind::BrowserFailure, "no page target to attach to");

    ws_ = curl_easy_init();
    if (!ws_) return fail(ErrorKind::BrowserFailure, "curl_easy_init failed");

    curl_easy_setopt(ws_, CURLOPT_URL, ws_url.c_str());
    curl_easy_setopt(ws_, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(ws_, CURLOPT_CONNECTTIMEOUT, 5L);

    CURLcode res = curl_easy_perform(ws_);
    if (res != CURLE_OK) {
        detach();
        return fail(ErrorKind::BrowserFailure, std::string("websocket connect: ") + curl_easy_strerror(res));
    }
    return {};
}

void DevToolsClient::detach() {
    if (ws_) {
        curl_easy_cleanup(ws_);
        ws_ = nullptr;
    }
}

std::expected<json, Error> DevToolsClient::call(const std::string& method, const json& params,
                                                std::chrono::milliseconds timeout) {
    if (auto res = attach(); !res) return std::unexpected(res.error());

    int64_t id = next_id_++;
    json msg = {{"id", id}, {"method", method}, {"params", params}};
    if (auto res = send_text(msg.dump()); !res) return std::unexpected(res.error());

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        auto text = recv_message(deadline);
        if (!text) return std::unexpected(text.error());

        json reply;
        try {
            reply = json::parse(*text);
        } catch (const json::exception& e) {
            return fail(ErrorKind::BrowserFailure, std::string("bad DevTools message: ") + e.what());
        }
        if (!reply.contains("id") || reply["id"] != id) continue;

        if (reply.contains("error")) {
            return fail(ErrorKind::BrowserFailure,
                        std::format("{}: {}", method, reply["error"].value("message", "failed")));
        }
        return reply.value("result", json::object());
    }
}

std::expected<void, Error> DevToolsClient::send_text(const std::string& text) {
    // A short send is resumed with the remaining bytes and the same flags.
    size_t offset = 0;
    while (offset < text.size()) {
        size_t sent = 0;
        CURLcode res = curl_ws_send(ws_, text.data() + offset, text.size() - offset, &sent, 0, CURLWS_TEXT);
        if (res == CURLE_AGAIN) {
            offset += sent;
            if (!wait_socket(POLLOUT, SEND_TIMEOUT)) {
                detach();
                return fail(ErrorKind::BrowserFailure, "websocket send timed out");
            }
            continue;
        }
        if (res != CURLE_OK) {
            detach();
            return fail(ErrorKind::BrowserFailure, std::string("websocket send: ") + curl_easy_strerror(res));
        }
        offset += sent;
    }
    return {};
}

bool DevToolsClient::wait_socket(short events, std::chrono::milliseconds timeout) {
    curl_socket_t sock = CURL_SOCKET_BAD;
    if (curl_easy_getinfo(ws_, CURLINFO_ACTIVESOCKET, &sock) != CURLE_OK || sock == CURL_SOCKET_BAD) {
        return false;
    }
    pollfd pfd{.fd = sock, .events = events, .revents = 0};
    return ::poll(&pfd, 1, static_cast<int>(timeout.count())) > 0;
}

std::expected<std::string, Error> DevToolsClient::recv_message(std::chrono::steady_clock::time_point deadline) {
    std::string message;
    char buf[16384];

    for (;;) {
        size_t received = 0;
        const curl_ws_frame* meta = nullptr;
        CURLcode res = curl_ws_recv(ws_, buf, sizeof(buf), &received, &meta);

        if (res == CURLE_AGAIN) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) return fail(ErrorKind::BrowserFailure, "DevTools reply timed out");
            wait_socket(POLLIN, left);
            continue;
        }
        if (res != CURLE_OK) {
            detach();
            return fail(ErrorKind::BrowserFailure, std::string("websocket recv: ") + curl_easy_strerror(res));
        }
        if (meta && (meta->flags & CURLWS_CLOSE)) {
            detach();
            return fail(ErrorKind::BrowserFailure, "browser closed the DevTools session");
        }
        if (meta && (meta->flags & (CURLWS_PING | CURLWS_PONG))) continue;

        message.append(buf, received);
        if (meta && (meta->bytesleft > 0 || (meta->flags & CURLWS_CONT))) continue;
        return message;
    }
}
