#pragma once

#include "enums.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace ember {

struct LedColor {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;

    bool operator==(const LedColor&) const = default;
};

// Snapshot of everything known about the mug.
// Temperatures are already in the configured display unit.
struct MugState {
    // Identity
    std::string address;

    // Connection
    ConnectionStatus connection_status = ConnectionStatus::Disconnected;
    bool available = false;

    // Opaque status code from the state notification, meaning mostly unknown
    std::optional<uint8_t> mug_status;

    // Readings
    std::optional<double> current_temperature;
    std::optional<double> target_temperature;
    std::optional<double> battery_percent;
    LedColor led_color{};

    // Characteristic UUID -> hex dump of the last value read
    std::map<std::string, std::string> diagnostic_readings;
};

} // namespace ember
