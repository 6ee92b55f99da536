#include "connection.hpp"

#include <protocol/codec.hpp>
#include <protocol/uuids.hpp>

#include <iostream>
#include <memory>

namespace ember {

ConnectionManager::ConnectionManager(Transport& transport, Scheduler& scheduler,
                                     const Config& config, MugState& state, Callbacks callbacks)
    : transport_(transport),
      scheduler_(scheduler),
      config_(config),
      state_(state),
      callbacks_(std::move(callbacks)) {}

void ConnectionManager::enqueue(Operation op) {
    queue_.push_back(std::move(op));
    if (!busy_) {
        run_next();
    }
}

void ConnectionManager::run_next() {
    if (queue_.empty()) {
        busy_ = false;
        return;
    }

    busy_ = true;
    auto op = std::move(queue_.front());
    queue_.pop_front();

    // Copies of the release handler share one flag; only the first call counts
    auto released = std::make_shared<bool>(false);
    op([this, released]() {
        if (*released) return;
        *released = true;
        run_next();
    });
}

void ConnectionManager::set_status(ConnectionStatus status) {
    state_.connection_status = status;
}

// ============================================================================
// Connect
// ============================================================================

void ConnectionManager::connect(std::function<void()> on_connected) {
    if (shutting_down_) {
        std::cerr << "connection: not connecting to " << transport_.address()
                  << ", shutting down" << std::endl;
        return;
    }

    connect_waiters_.push_back(std::move(on_connected));
    if (connecting_) {
        return;
    }

    connecting_ = true;
    set_status(ConnectionStatus::Connecting);
    attempt(1);
}

void ConnectionManager::attempt(int n) {
    if (shutting_down_) {
        connecting_ = false;
        connect_waiters_.clear();
        return;
    }

    ++total_attempts_;
    std::cout << "connection: connecting to " << transport_.address()
              << " (attempt " << n << "/" << config_.connect_attempts << ")" << std::endl;

    enqueue([this, n](Release release) {
        transport_.connect([this, n, release](const Status& status) {
            if (status) {
                release();
                attempt_failed(n, *status);
                return;
            }

            transport_.pair([this, n, release](const Status& status) {
                release();
                if (shutting_down_) {
                    connecting_ = false;
                    connect_waiters_.clear();
                    return;
                }
                if (status) {
                    attempt_failed(n, *status);
                    return;
                }

                std::cout << "connection: connected to " << transport_.address()
                          << " on attempt " << n << std::endl;
                set_status(ConnectionStatus::Connected);
                subscribe_state();
            });
        });
    });
}

void ConnectionManager::attempt_failed(int n, const Error& error) {
    if (shutting_down_) {
        connecting_ = false;
        connect_waiters_.clear();
        return;
    }

    if (n < config_.connect_attempts) {
        std::cerr << "connection: attempt " << n << "/" << config_.connect_attempts
                  << " to " << transport_.address() << " failed: " << error.describe()
                  << ", retrying in "
                  << std::chrono::duration_cast<std::chrono::seconds>(config_.connect_retry_delay).count()
                  << "s" << std::endl;
        scheduler_.call_later(config_.connect_retry_delay, [this, n]() { attempt(n + 1); });
        return;
    }

    std::cerr << "connection: failed to connect to " << transport_.address()
              << " after " << n << " attempts (" << error.describe() << "), retrying in "
              << std::chrono::duration_cast<std::chrono::seconds>(config_.connect_backoff).count()
              << "s" << std::endl;

    set_status(ConnectionStatus::Disconnected);
    scheduler_.call_later(config_.connect_backoff, [this]() {
        if (shutting_down_) {
            connecting_ = false;
            connect_waiters_.clear();
            return;
        }
        set_status(ConnectionStatus::Connecting);
        attempt(1);
    });

    if (callbacks_.on_connection_failed) {
        deliver(callbacks_.on_connection_failed);
    }
}

void ConnectionManager::subscribe_state() {
    std::cout << "connection: subscribing to state of " << transport_.address() << std::endl;

    enqueue([this](Release release) {
        auto on_value = [this](const std::string& uuid, const Bytes& value) {
            on_notification(uuid, value);
        };

        transport_.subscribe(uuids::STATE, on_value, [this, release](const Status& status) {
            release();
            if (status) {
                // Polling still works without pushes
                std::cerr << "connection: failed to subscribe to state of "
                          << transport_.address() << ": " << status->describe() << std::endl;
            } else if (!shutting_down_) {
                set_status(ConnectionStatus::Subscribed);
            }
            finish_connect();
        });
    });
}

void ConnectionManager::finish_connect() {
    connecting_ = false;

    auto waiters = std::move(connect_waiters_);
    connect_waiters_.clear();

    if (shutting_down_) {
        return;
    }
    for (auto& waiter : waiters) {
        if (waiter) deliver(waiter);
    }
}

// ============================================================================
// Characteristic access
// ============================================================================

void ConnectionManager::read_characteristic(const std::string& uuid, Transport::ReadHandler done) {
    if (shutting_down_) {
        scheduler_.post([this, uuid, done = std::move(done)]() {
            deliver([&]() { done(transport_error("read " + uuid, "shutting down"), Bytes{}); });
        });
        return;
    }

    enqueue([this, uuid, done = std::move(done)](Release release) {
        transport_.read_characteristic(uuid, [this, release, done](const Status& status, const Bytes& value) {
            release();
            deliver([&]() { done(status, value); });
        });
    });
}

void ConnectionManager::write_characteristic(const std::string& uuid, const Bytes& value,
                                             bool response, Transport::DoneHandler done) {
    if (shutting_down_) {
        scheduler_.post([this, uuid, done = std::move(done)]() {
            deliver([&]() { done(transport_error("write " + uuid, "shutting down")); });
        });
        return;
    }

    enqueue([this, uuid, value, response, done = std::move(done)](Release release) {
        transport_.write_characteristic(uuid, value, response, [this, release, done](const Status& status) {
            release();
            deliver([&]() { done(status); });
        });
    });
}

void ConnectionManager::set_target_temperature(double celsius, Transport::DoneHandler done) {
    auto payload = codec::encode_temperature(celsius);
    if (!payload) {
        Error error{ErrorKind::Encode, "set_target_temperature",
                    "target " + std::to_string(celsius) + "C does not fit in 16 bits"};
        std::cerr << "connection: " << error.describe() << std::endl;
        scheduler_.post([this, done = std::move(done), error]() {
            deliver([&]() { done(error); });
        });
        return;
    }

    std::cout << "connection: setting target temperature of " << transport_.address()
              << " to " << celsius << "C" << std::endl;

    Bytes value(payload->begin(), payload->end());
    write_characteristic(uuids::TARGET_TEMP, value, false,
                         [this, done = std::move(done)](const Status& status) {
        if (status) {
            std::cerr << "connection: set target temperature on " << transport_.address()
                      << " failed: " << status->describe() << std::endl;
        } else {
            std::cout << "connection: target temperature write acknowledged by "
                      << transport_.address() << std::endl;
        }
        done(status);
    });
}

// ============================================================================
// Notifications
// ============================================================================

void ConnectionManager::on_notification(const std::string& sender, const Bytes& payload) {
    auto new_state = codec::decode_status(payload);
    if (!new_state) {
        std::cerr << "connection: empty state notification from " << sender << std::endl;
        return;
    }

    // 1 is pushed constantly and carries nothing new
    if (*new_state == 1 || state_.mug_status == new_state) {
        return;
    }

    std::cout << "connection: state of " << transport_.address() << " changed from ";
    if (state_.mug_status) {
        std::cout << static_cast<int>(*state_.mug_status);
    } else {
        std::cout << "unknown";
    }
    std::cout << " to " << static_cast<int>(*new_state) << std::endl;

    state_.mug_status = new_state;
    if (callbacks_.on_changed) {
        deliver(callbacks_.on_changed);
    }
}

// ============================================================================
// Disconnect
// ============================================================================

void ConnectionManager::disconnect(std::function<void()> done) {
    shutting_down_ = true;
    bool was_subscribed = state_.connection_status == ConnectionStatus::Subscribed;
    set_status(ConnectionStatus::ShuttingDown);

    enqueue([this, was_subscribed, done = std::move(done)](Release release) {
        auto finish = [this, release, done]() {
            set_status(ConnectionStatus::Disconnected);
            release();
            std::cout << "connection: disconnected from " << transport_.address() << std::endl;
            if (done) deliver(done);
        };

        auto close_link = [this, finish]() {
            if (!transport_.is_connected()) {
                finish();
                return;
            }
            transport_.disconnect([this, finish](const Status& status) {
                if (status) {
                    std::cerr << "connection: ignoring disconnect failure on "
                              << transport_.address() << ": " << status->describe() << std::endl;
                }
                finish();
            });
        };

        if (!was_subscribed) {
            close_link();
            return;
        }

        transport_.unsubscribe(uuids::STATE, [this, close_link](const Status& status) {
            if (status) {
                std::cerr << "connection: ignoring unsubscribe failure on "
                          << transport_.address() << ": " << status->describe() << std::endl;
            }
            close_link();
        });
    });
}

void ConnectionManager::mark_disconnected() {
    if (shutting_down_ || connecting_) {
        return;
    }
    set_status(ConnectionStatus::Disconnected);
}

} // namespace ember
