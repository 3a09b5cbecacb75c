#pragma once

#include <functional>
#include <linux/input.h>
#include <string>
#include <thread>
#include <vector>

// Reads input_event records from every /dev/input/event* device accepted by
// a capability filter, on one epoll thread. Needs read access to the
// devices (the "input" group).
class EvdevReader {
public:
    using DeviceFilter = std::function<bool(int fd)>;
    using Handler = std::function<void(const input_event&)>;

    EvdevReader(std::string name, DeviceFilter filter);
    ~EvdevReader();

    EvdevReader(const EvdevReader&) = delete;
    EvdevReader& operator=(const EvdevReader&) = delete;

    bool start(Handler handler);
    void stop();

    size_t device_count() const { return device_fds_.size(); }

    // Capability probe for filters.
    static bool has_bit(int fd, unsigned type, unsigned code);

private:
    void run(std::stop_token st);
    void close_all();

    std::string name_;
    DeviceFilter filter_;
    Handler handler_;

    std::vector<int> device_fds_;
    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::jthread thread_;
};
