#include "poll.hpp"

#include <protocol/codec.hpp>
#include <protocol/uuids.hpp>

#include <iostream>

namespace ember {

static Error decode_error(const char* name, const Bytes& value) {
    return Error{ErrorKind::Decode, name,
                 "unexpected payload " + codec::to_hex(value) + " (" +
                     std::to_string(value.size()) + " bytes)"};
}

PollCycle::PollCycle(ConnectionManager& connection, const Config& config, MugState& state)
    : connection_(connection), config_(config), state_(state) {
    steps_ = {
        {"led_color", uuids::LED_COLOR, [this](const Bytes& value) -> Status {
            auto color = codec::decode_color(value);
            if (!color) return decode_error("led_color", value);
            state_.led_color = *color;
            return std::nullopt;
        }},
        {"current_temp", uuids::CURRENT_TEMP, [this](const Bytes& value) -> Status {
            auto temp = codec::decode_temperature(value, config_.use_metric);
            if (!temp) return decode_error("current_temp", value);
            state_.current_temperature = *temp;
            return std::nullopt;
        }},
        {"target_temp", uuids::TARGET_TEMP, [this](const Bytes& value) -> Status {
            auto temp = codec::decode_temperature(value, config_.use_metric);
            if (!temp) return decode_error("target_temp", value);
            state_.target_temperature = *temp;
            return std::nullopt;
        }},
        {"battery", uuids::BATTERY, [this](const Bytes& value) -> Status {
            auto battery = codec::decode_battery(value);
            if (!battery) return decode_error("battery", value);
            state_.battery_percent = *battery;
            return std::nullopt;
        }},
    };
}

static bool abandoned(const PollCycle::Alive& alive) {
    return alive && !alive();
}

void PollCycle::run(DoneHandler done, Alive alive) {
    ++cycles_;

    if (!connection_.is_connected()) {
        std::cout << "poll: " << state_.address << " not connected, connecting first" << std::endl;
        connection_.connect([this, done, alive]() { read_step(0, done, alive); });
        return;
    }

    read_step(0, std::move(done), std::move(alive));
}

void PollCycle::read_step(size_t index, DoneHandler done, Alive alive) {
    if (abandoned(alive)) {
        return;
    }

    if (index == steps_.size()) {
        log_summary();
        if (diagnostics_due()) {
            run_diagnostics([done]() { done(true); }, alive);
        } else {
            done(true);
        }
        return;
    }

    const Step& step = steps_[index];
    connection_.read_characteristic(step.uuid,
        [this, index, done, alive](const Status& status, const Bytes& value) {
            if (abandoned(alive)) {
                return;
            }

            const Step& step = steps_[index];
            if (status) {
                std::cerr << "poll: reading " << step.name << " from " << state_.address
                          << " failed: " << status->describe() << std::endl;
                done(false);
                return;
            }

            if (auto error = step.apply(value)) {
                std::cerr << "poll: " << error->describe() << " from " << state_.address << std::endl;
                done(false);
                return;
            }

            read_step(index + 1, done, alive);
        });
}

bool PollCycle::diagnostics_due() const {
    return config_.diagnostic_every > 0 && cycles_ % config_.diagnostic_every == 0;
}

void PollCycle::run_diagnostics(std::function<void()> done, Alive alive) {
    sweep_step(0, std::move(done), std::move(alive));
}

void PollCycle::sweep_step(size_t index, std::function<void()> done, Alive alive) {
    if (abandoned(alive)) {
        return;
    }

    if (index == uuids::UNKNOWN_READ.size()) {
        done();
        return;
    }

    std::string uuid = uuids::UNKNOWN_READ[index];
    connection_.read_characteristic(uuid,
        [this, index, uuid, done, alive](const Status& status, const Bytes& value) {
            if (abandoned(alive)) {
                return;
            }

            if (status) {
                std::cerr << "poll: failed to update " << uuid << ": " << status->describe() << std::endl;
            } else {
                auto text = codec::to_hex(value);
                std::cout << "poll: current value of " << uuid << ": " << text << std::endl;
                state_.diagnostic_readings[uuid] = text;
            }
            sweep_step(index + 1, done, alive);
        });
}

void PollCycle::log_summary() const {
    const char* unit = config_.use_metric ? "C" : "F";
    std::cout << "poll: " << state_.address
              << " current=" << state_.current_temperature.value_or(0.0) << unit
              << " target=" << state_.target_temperature.value_or(0.0) << unit
              << " battery=" << state_.battery_percent.value_or(0.0) << "%"
              << " color=" << codec::format_color_hex(state_.led_color) << std::endl;
}

} // namespace ember
