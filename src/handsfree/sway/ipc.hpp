#pragma once

#include "error.hpp"
#include "sway/window_info.hpp"

#include <cstdint>
#include <expected>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

class SwayIpc {
public:
    SwayIpc();
    ~SwayIpc();

    SwayIpc(const SwayIpc&) = delete;
    SwayIpc& operator=(const SwayIpc&) = delete;

    // Connect to Sway IPC. Returns false if $SWAYSOCK not set or connection fails.
    bool connect();
    bool connected() const { return query_fd_ >= 0; }

    // Runs a sway command, e.g. "[con_id=12] focus". Fails with
    // InjectionFailure when sway rejects it.
    std::expected<void, Error> run_command(const std::string& command);

    std::expected<nlohmann::json, Error> get_tree();

    // Application windows of a layout tree in tree order (tiled before floating per container).
    static std::vector<WindowInfo> collect_windows(const nlohmann::json& tree);
    static WindowInfo find_focused(const nlohmann::json& tree);

private:
    // i3-ipc binary protocol
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr uint32_t MSG_RUN_COMMAND = 0;
    static constexpr uint32_t MSG_GET_TREE = 4;

    std::expected<std::string, Error> request(uint32_t type, const std::string& payload = "");
    bool send_message(int fd, uint32_t type, const std::string& payload = "");
    bool recv_message(int fd, uint32_t& type, std::string& payload);

    int connect_socket(const std::string& path);

    std::mutex mu_;
    int query_fd_ = -1;
    std::string sway_sock_;
};
