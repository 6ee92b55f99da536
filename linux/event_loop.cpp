#include "event_loop.hpp"

#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace event_loop {

// Upper bound on a single poll, keeps the stop flag responsive
constexpr int MAX_POLL_MS = 100;

void EventLoop::post(Task task) {
    call_later(std::chrono::milliseconds(0), std::move(task));
}

void EventLoop::call_later(std::chrono::milliseconds delay, Task task) {
    timers_.emplace(std::make_pair(Clock::now() + delay, seq_++), std::move(task));
}

void EventLoop::add_connection(DBusConnection* conn) {
    connections_.push_back(conn);
}

void EventLoop::dispatch_all() {
    for (DBusConnection* conn : connections_) {
        while (dbus_connection_dispatch(conn) == DBUS_DISPATCH_DATA_REMAINS) {
            // Keep processing
        }
    }
}

void EventLoop::run_due_timers() {
    auto now = Clock::now();

    // Tasks posted while draining wait for the next turn
    std::vector<Task> due;
    while (!timers_.empty() && timers_.begin()->first.first <= now) {
        due.push_back(std::move(timers_.begin()->second));
        timers_.erase(timers_.begin());
    }

    for (auto& task : due) {
        task();
    }
}

int EventLoop::next_timeout_ms() const {
    if (timers_.empty()) {
        return MAX_POLL_MS;
    }

    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
        timers_.begin()->first.first - Clock::now());
    return static_cast<int>(std::clamp<int64_t>(wait.count(), 0, MAX_POLL_MS));
}

void EventLoop::run(const std::function<bool()>& keep_running) {
    while (keep_running()) {
        // Messages already buffered by a blocking call would not wake poll()
        dispatch_all();
        run_due_timers();

        for (DBusConnection* conn : connections_) {
            dbus_connection_flush(conn);
        }

        std::vector<pollfd> fds;
        for (DBusConnection* conn : connections_) {
            int fd = -1;
            if (dbus_connection_get_unix_fd(conn, &fd) && fd >= 0) {
                pollfd pfd = {};
                pfd.fd = fd;
                pfd.events = POLLIN;
                fds.push_back(pfd);
            }
        }

        int ret = poll(fds.data(), fds.size(), next_timeout_ms());
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::cerr << "event_loop: poll error: " << strerror(errno) << std::endl;
            break;
        }

        for (DBusConnection* conn : connections_) {
            dbus_connection_read_write(conn, 0);
        }
    }
}

} // namespace event_loop
