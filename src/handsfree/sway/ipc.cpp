#include "sway/ipc.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using json = nlohmann::json;

namespace {

// Sway reports null for app_id on XWayland clients.
std::string string_field(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

int int_field(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_number()) return 0;
    return it->get<int>();
}

bool is_window(const json& node) {
    auto type = string_field(node, "type");
    if (type != "con" && type != "floating_con") return false;
    return node.contains("app_id") || node.contains("window_properties") || int_field(node, "pid") > 0;
}

WindowInfo window_from(const json& node) {
    WindowInfo info;
    info.handle = node.value("id", int64_t{0});
    info.app_id = string_field(node, "app_id");
    if (auto props = node.find("window_properties"); props != node.end() && props->is_object()) {
        info.window_class = string_field(*props, "class");
    }
    info.title = string_field(node, "name");
    info.pid = int_field(node, "pid");
    if (auto r = node.find("rect"); r != node.end() && r->is_object()) {
        info.rect = Rect{
            .x = int_field(*r, "x"),
            .y = int_field(*r, "y"),
            .width = int_field(*r, "width"),
            .height = int_field(*r, "height"),
        };
    }
    info.focused = node.value("focused", false);
    return info;
}

void collect(const json& node, std::vector<WindowInfo>& out) {
    if (is_window(node)) {
        out.push_back(window_from(node));
        return;
    }
    for (const char* key : {"nodes", "floating_nodes"}) {
        auto it = node.find(key);
        if (it == node.end() || !it->is_array()) continue;
        for (const auto& child : *it) collect(child, out);
    }
}

} // namespace

SwayIpc::SwayIpc() = default;

SwayIpc::~SwayIpc() {
    if (query_fd_ >= 0) ::close(query_fd_);
}

bool SwayIpc::connect() {
    const char* sock = std::getenv("SWAYSOCK");
    if (!sock) {
        std::println(stderr, "sway: $SWAYSOCK not set");
        return false;
    }
    sway_sock_ = sock;

    query_fd_ = connect_socket(sway_sock_);
    return query_fd_ >= 0;
}

std::expected<void, Error> SwayIpc::run_command(const std::string& command) {
    auto reply = request(MSG_RUN_COMMAND, command);
    if (!reply) return std::unexpected(reply.error());

    try {
        auto results = json::parse(*reply);
        for (const auto& r : results) {
            if (!r.value("success", false)) {
                return fail(ErrorKind::InjectionFailure,
                            "sway rejected '" + command + "': " + string_field(r, "error"));
            }
        }
    } catch (const json::exception& e) {
        return fail(ErrorKind::InjectionFailure, std::string("sway: bad command reply: ") + e.what());
    }
    return {};
}

std::expected<json, Error> SwayIpc::get_tree() {
    auto reply = request(MSG_GET_TREE);
    if (!reply) return std::unexpected(reply.error());

    try {
        return json::parse(*reply);
    } catch (const json::exception& e) {
        return fail(ErrorKind::LookupFailed, std::string("sway: bad tree: ") + e.what());
    }
}

std::vector<WindowInfo> SwayIpc::collect_windows(const json& tree) {
    std::vector<WindowInfo> out;
    collect(tree, out);
    return out;
}

WindowInfo SwayIpc::find_focused(const json& tree) {
    for (auto& w : collect_windows(tree)) {
        if (w.focused) return w;
    }
    return {};
}

std::expected<std::string, Error> SwayIpc::request(uint32_t type, const std::string& payload) {
    std::lock_guard lock(mu_);
    if (query_fd_ < 0) return fail(ErrorKind::Io, "sway: not connected");

    if (!send_message(query_fd_, type, payload)) {
        return fail(ErrorKind::Io, std::string("sway: send failed: ") + std::strerror(errno));
    }

    uint32_t reply_type;
    std::string reply;
    if (!recv_message(query_fd_, reply_type, reply)) {
        return fail(ErrorKind::Io, "sway: connection closed");
    }
    if (reply_type != type) {
        return fail(ErrorKind::Io, "sway: unexpected reply type " + std::to_string(reply_type));
    }
    return reply;
}

int SwayIpc::connect_socket(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "sway: connect failed: {}", std::strerror(errno));
        ::close(fd);
        return -1;
    }
    return fd;
}

bool SwayIpc::send_message(int fd, uint32_t type, const std::string& payload) {
    // Header: "i3-ipc" (6 bytes) + length (4 bytes) + type (4 bytes)
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[14];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(fd, header, 14, MSG_NOSIGNAL) != 14) return false;
    if (len > 0) {
        if (::send(fd, payload.data(), len, MSG_NOSIGNAL) != static_cast<ssize_t>(len))
            return false;
    }
    return true;
}

bool SwayIpc::recv_message(int fd, uint32_t& type, std::string& payload) {
    char header[14];
    size_t read_total = 0;
    while (read_total < 14) {
        ssize_t n = ::recv(fd, header + read_total, 14 - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    if (std::memcmp(header, MAGIC, 6) != 0) return false;

    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type, header + 10, 4);

    payload.resize(len);
    read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(fd, payload.data() + read_total, len - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    return true;
}
