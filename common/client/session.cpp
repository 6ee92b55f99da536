#include "session.hpp"

#include <algorithm>
#include <iostream>

namespace ember {

Session::Session(Transport& transport, Scheduler& scheduler, Config config,
                 ChangedHandler on_changed)
    : config_(std::move(config)),
      scheduler_(scheduler),
      connection_(transport, scheduler, config_, state_,
                  ConnectionManager::Callbacks{
                      [this]() { notify_changed(); },
                      [this]() {
                          state_.available = false;
                          notify_changed();
                      },
                      [this](const std::exception& e) { restart(e.what()); },
                  }),
      poll_(connection_, config_, state_),
      on_changed_(std::move(on_changed)) {
    state_.address = config_.address;
}

void Session::start() {
    if (session_state_ == SessionState::Running) {
        return;
    }
    run();
}

void Session::run() {
    session_state_ = SessionState::Running;
    std::cout << "session: starting loop for " << state_.address << std::endl;

    uint64_t generation = generation_;
    scheduler_.post(guard(generation, std::function<void()>([this, generation]() {
        iterate(generation);
    })));
}

void Session::iterate(uint64_t generation) {
    ++iterations_;

    if (!connection_.is_connected()) {
        connection_.connect(guard(generation, std::function<void()>([this, generation]() {
            poll(generation);
        })));
        return;
    }

    poll(generation);
}

void Session::poll(uint64_t generation) {
    poll_.run(guard(generation, std::function<void(bool)>([this, generation](bool success) {
                  after_poll(generation, success);
              })),
              [this, generation]() { return is_current(generation); });
}

void Session::after_poll(uint64_t generation, bool success) {
    if (success) {
        state_.available = true;
    } else {
        std::cerr << "session: poll cycle for " << state_.address << " failed" << std::endl;
    }

    notify_changed();

    // The iteration got through; the next failure restarts immediately again
    if (success) {
        consecutive_restarts_ = 0;
    }
    dwell(generation, config_.dwell_checks);
}

void Session::dwell(uint64_t generation, int remaining) {
    if (remaining <= 0) {
        iterate(generation);
        return;
    }

    scheduler_.call_later(config_.dwell_check_interval,
        guard(generation, std::function<void()>([this, generation, remaining]() {
            if (!connection_.is_connected() && !connection_.is_connecting()) {
                link_lost();
                iterate(generation);
                return;
            }
            dwell(generation, remaining - 1);
        })));
}

void Session::link_lost() {
    std::cerr << "session: lost connection to " << state_.address << std::endl;
    state_.available = false;
    connection_.mark_disconnected();
    notify_changed();
}

void Session::notify_changed() {
    if (on_changed_) {
        on_changed_();
    }
}

std::chrono::milliseconds Session::restart_delay() const {
    // First restart after a healthy run is immediate, then 1s, 2s, 4s, ...
    if (consecutive_restarts_ <= 1) {
        return std::chrono::milliseconds(0);
    }
    int exponent = std::min(consecutive_restarts_ - 2, 16);
    std::chrono::milliseconds delay = std::chrono::seconds(1) * (1 << exponent);
    return std::min(delay, config_.restart_backoff_max);
}

void Session::restart(const std::string& reason) {
    if (session_state_ != SessionState::Running) {
        std::cerr << "session: ignoring failure for " << state_.address << " while "
                  << to_string(session_state_) << ": " << reason << std::endl;
        return;
    }

    ++restarts_;
    ++consecutive_restarts_;
    ++generation_;
    session_state_ = SessionState::Restarting;

    // A burst in progress keeps going; the next run waits on it afresh
    connection_.drop_connect_waiters();

    auto delay = restart_delay();
    std::cerr << "session: unexpected error in loop for " << state_.address << ": " << reason
              << ". Restarting (restart " << restarts_ << ", in " << delay.count() << "ms)"
              << std::endl;

    auto task = [this]() {
        if (session_state_ == SessionState::Restarting) {
            run();
        }
    };
    if (delay.count() == 0) {
        scheduler_.post(task);
    } else {
        scheduler_.call_later(delay, task);
    }
}

void Session::disconnect(std::function<void()> done) {
    std::cout << "session: stopping loop for " << state_.address << std::endl;

    session_state_ = SessionState::Stopped;
    ++generation_;
    state_.available = false;

    connection_.disconnect([this, done]() {
        notify_changed();
        if (done) done();
    });
}

void Session::set_target_temperature(double celsius, Transport::DoneHandler done) {
    connection_.set_target_temperature(celsius, std::move(done));
}

} // namespace ember
