#include "platform/linux/evdev_reader.hpp"

#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <print>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace fs = std::filesystem;

EvdevReader::EvdevReader(std::string name, DeviceFilter filter)
    : name_(std::move(name)), filter_(std::move(filter)) {}

EvdevReader::~EvdevReader() {
    stop();
}

bool EvdevReader::has_bit(int fd, unsigned type, unsigned code) {
    constexpr size_t BITS = sizeof(unsigned long) * CHAR_BIT;
    unsigned long bits[(KEY_MAX + BITS) / BITS] = {};
    if (::ioctl(fd, EVIOCGBIT(type, sizeof(bits)), bits) < 0) return false;
    return (bits[code / BITS] >> (code % BITS)) & 1UL;
}

bool EvdevReader::start(Handler handler) {
    if (thread_.joinable()) return true;
    handler_ = std::move(handler);

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator("/dev/input", ec)) {
        auto file = entry.path().filename().string();
        if (!file.starts_with("event")) continue;

        int fd = ::open(entry.path().c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) continue;
        if (filter_(fd)) {
            device_fds_.push_back(fd);
        } else {
            ::close(fd);
        }
    }
    if (ec) {
        std::println(stderr, "{}: cannot list /dev/input: {}", name_, ec.message());
        return false;
    }
    if (device_fds_.empty()) {
        std::println(stderr, "{}: no readable devices (is the user in the input group?)", name_);
        return false;
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "{}: epoll_create1 failed: {}", name_, std::strerror(errno));
        close_all();
        return false;
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        std::println(stderr, "{}: eventfd failed: {}", name_, std::strerror(errno));
        close_all();
        return false;
    }

    auto add_fd = [this](int fd) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(wake_fd_)) {
        std::println(stderr, "{}: epoll_ctl failed: {}", name_, std::strerror(errno));
        close_all();
        return false;
    }
    for (int fd : device_fds_) {
        if (!add_fd(fd)) {
            std::println(stderr, "{}: epoll_ctl failed: {}", name_, std::strerror(errno));
            close_all();
            return false;
        }
    }

    thread_ = std::jthread([this](std::stop_token st) { run(st); });
    return true;
}

void EvdevReader::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        uint64_t val = 1;
        if (::write(wake_fd_, &val, sizeof(val)) < 0) {
            std::println(stderr, "{}: wake failed: {}", name_, std::strerror(errno));
        }
        thread_.join();
    }
    close_all();
}

void EvdevReader::close_all() {
    for (int fd : device_fds_) ::close(fd);
    device_fds_.clear();
    if (epoll_fd_ >= 0) { ::close(epoll_fd_); epoll_fd_ = -1; }
    if (wake_fd_ >= 0) { ::close(wake_fd_); wake_fd_ = -1; }
}

void EvdevReader::run(std::stop_token st) {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];
    input_event buf[64];

    while (!st.stop_requested()) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "{}: epoll_wait error: {}", name_, std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;
            if (fd == wake_fd_) continue;

            if (events[i].events & (EPOLLHUP | EPOLLERR)) {
                // Device unplugged.
                epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
                continue;
            }

            ssize_t len = ::read(fd, buf, sizeof(buf));
            if (len < 0) {
                if (errno != EAGAIN && errno != EINTR) {
                    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
                }
                continue;
            }
            size_t count = static_cast<size_t>(len) / sizeof(input_event);
            for (size_t k = 0; k < count; ++k) handler_(buf[k]);
        }
    }
}
