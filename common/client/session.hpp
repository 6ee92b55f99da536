#pragma once

#include "connection.hpp"
#include "poll.hpp"
#include "scheduler.hpp"
#include "transport.hpp"
#include "../types/config.hpp"
#include "../types/enums.hpp"
#include "../types/mug.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace ember {

// Long-running client for one mug.
//
// Each iteration: ensure connected, run a poll cycle, fire the change
// handler, then dwell for dwell_checks * dwell_check_interval, checking the
// link on every tick. An exception escaping any step abandons the current
// run and schedules a fresh one; consecutive restarts back off
// exponentially up to restart_backoff_max.
class Session {
public:
    using ChangedHandler = std::function<void()>;

    Session(Transport& transport, Scheduler& scheduler, Config config, ChangedHandler on_changed);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void start();

    // Stop the loop at its next check and close the link. In-flight
    // operations finish first. done runs once the link is closed.
    void disconnect(std::function<void()> done = {});

    // Write command surface, value in Celsius
    void set_target_temperature(double celsius, Transport::DoneHandler done);

    // Copy of the current state
    MugState snapshot() const { return state_; }

    SessionState session_state() const { return session_state_; }
    const Config& config() const { return config_; }

    int iterations() const { return iterations_; }
    int restarts() const { return restarts_; }

    const ConnectionManager& connection() const { return connection_; }

private:
    void run();
    void iterate(uint64_t generation);
    void poll(uint64_t generation);
    void after_poll(uint64_t generation, bool success);
    void dwell(uint64_t generation, int remaining);
    void link_lost();
    void restart(const std::string& reason);
    std::chrono::milliseconds restart_delay() const;
    void notify_changed();

    // True while the run started at generation is the live one
    bool is_current(uint64_t generation) const {
        return generation == generation_ && session_state_ == SessionState::Running;
    }

    // Wrap a continuation so it is dropped once its run is abandoned and
    // any exception it throws restarts the loop
    template <typename... Args>
    std::function<void(Args...)> guard(uint64_t generation, std::function<void(Args...)> step) {
        return [this, generation, step = std::move(step)](Args... args) {
            if (!is_current(generation)) {
                return;
            }
            try {
                step(args...);
            } catch (const std::exception& e) {
                restart(e.what());
            }
        };
    }

    Config config_;
    Scheduler& scheduler_;
    MugState state_;
    ConnectionManager connection_;
    PollCycle poll_;
    ChangedHandler on_changed_;

    SessionState session_state_ = SessionState::Stopped;
    uint64_t generation_ = 0;
    int iterations_ = 0;
    int restarts_ = 0;
    int consecutive_restarts_ = 0;
};

} // namespace ember
