#pragma once

#include "../types/mug.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ember::codec {

// Temperatures travel as little-endian uint16 hundredths of a degree Celsius
constexpr double TEMPERATURE_SCALE = 0.01;

// Round to two decimal places
double round2(double value);

double celsius_to_fahrenheit(double celsius);
double fahrenheit_to_celsius(double fahrenheit);

// Decode a 2-byte temperature, converting to Fahrenheit unless metric.
// Returns nullopt if the payload is not exactly 2 bytes.
std::optional<double> decode_temperature(std::span<const uint8_t> data, bool metric);

// Encode a Celsius value for the target temperature characteristic.
// Returns nullopt if the scaled value does not fit in 16 bits.
std::optional<std::array<uint8_t, 2>> encode_temperature(double celsius);

// First byte is the charge percentage
std::optional<double> decode_battery(std::span<const uint8_t> data);

// RGBA payload, alpha is dropped
std::optional<LedColor> decode_color(std::span<const uint8_t> data);

// #rrggbb, lowercase
std::string format_color_hex(uint8_t r, uint8_t g, uint8_t b);
std::string format_color_hex(const LedColor& color);

// First byte of a state notification
std::optional<uint8_t> decode_status(std::span<const uint8_t> data);

// Lowercase hex dump used for diagnostic readings
std::string to_hex(std::span<const uint8_t> data);

// Parse MAC address string (AA:BB:CC:DD:EE:FF) to bytes
std::optional<std::array<uint8_t, 6>> parse_address(std::string_view address);

} // namespace ember::codec
