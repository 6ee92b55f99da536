#pragma once

#include <client/scheduler.hpp>

#include <dbus/dbus.h>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace event_loop {

// poll(2) loop over D-Bus connections plus a timer queue.
// Everything runs on the calling thread.
class EventLoop : public ember::Scheduler {
public:
    using Clock = std::chrono::steady_clock;

    void post(Task task) override;
    void call_later(std::chrono::milliseconds delay, Task task) override;

    // Watch a connection's fd and dispatch its messages
    void add_connection(DBusConnection* conn);

    // Run until keep_running returns false
    void run(const std::function<bool()>& keep_running);

private:
    void dispatch_all();
    void run_due_timers();
    int next_timeout_ms() const;

    // Ordered by deadline, then insertion
    std::map<std::pair<Clock::time_point, uint64_t>, Task> timers_;
    uint64_t seq_ = 0;
    std::vector<DBusConnection*> connections_;
};

} // namespace event_loop
