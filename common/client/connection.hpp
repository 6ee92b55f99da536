#pragma once

#include "scheduler.hpp"
#include "transport.hpp"
#include "../types/config.hpp"
#include "../types/mug.hpp"
#include <deque>
#include <exception>
#include <functional>
#include <string>
#include <vector>

namespace ember {

// Owns every operation on the transport handle. Operations are queued and
// run one at a time, so the session loop and external writes never overlap.
class ConnectionManager {
public:
    struct Callbacks {
        std::function<void()> on_changed;            // status change applied from a notification
        std::function<void()> on_connection_failed;  // connect burst exhausted, backing off
        std::function<void(const std::exception&)> on_fault;  // a delivered handler threw
    };

    ConnectionManager(Transport& transport, Scheduler& scheduler, const Config& config,
                      MugState& state, Callbacks callbacks);

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    ConnectionStatus status() const { return state_.connection_status; }
    bool is_connected() const { return transport_.is_connected(); }
    bool is_connecting() const { return connecting_; }
    bool is_shutting_down() const { return shutting_down_; }

    // Connect and pair, retrying forever: bursts of connect_attempts tries,
    // connect_backoff between bursts. on_connected runs once the link is up
    // and the state subscription has been attempted.
    void connect(std::function<void()> on_connected);

    void read_characteristic(const std::string& uuid, Transport::ReadHandler done);
    void write_characteristic(const std::string& uuid, const Bytes& value, bool response,
                              Transport::DoneHandler done);

    // Encode a Celsius value and write it to the target temperature characteristic
    void set_target_temperature(double celsius, Transport::DoneHandler done);

    // State characteristic push. Status 1 and repeats of the current value are ignored.
    void on_notification(const std::string& sender, const Bytes& payload);

    // Best-effort unsubscribe and disconnect. Failures are logged and dropped;
    // done always runs.
    void disconnect(std::function<void()> done);

    // Link loss observed by someone else (liveness check, BlueZ signal)
    void mark_disconnected();

    // Forget everyone waiting on the current burst. The burst itself continues.
    void drop_connect_waiters() { connect_waiters_.clear(); }

    size_t connect_waiters() const { return connect_waiters_.size(); }

    // Connect attempts made since construction
    int total_attempts() const { return total_attempts_; }

private:
    using Release = std::function<void()>;
    using Operation = std::function<void(Release release)>;

    void enqueue(Operation op);
    void run_next();

    // Run a caller-supplied handler; exceptions go to on_fault
    template <typename F>
    void deliver(F&& handler) {
        try {
            handler();
        } catch (const std::exception& e) {
            if (!callbacks_.on_fault) throw;
            callbacks_.on_fault(e);
        }
    }

    void attempt(int n);
    void attempt_failed(int n, const Error& error);
    void subscribe_state();
    void finish_connect();
    void set_status(ConnectionStatus status);

    Transport& transport_;
    Scheduler& scheduler_;
    const Config& config_;
    MugState& state_;
    Callbacks callbacks_;

    std::deque<Operation> queue_;
    bool busy_ = false;

    bool connecting_ = false;
    bool shutting_down_ = false;
    int total_attempts_ = 0;
    std::vector<std::function<void()>> connect_waiters_;
};

} // namespace ember
