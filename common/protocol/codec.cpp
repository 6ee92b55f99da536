#include "codec.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>

namespace ember::codec {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

double celsius_to_fahrenheit(double celsius) {
    return celsius * 9.0 / 5.0 + 32.0;
}

double fahrenheit_to_celsius(double fahrenheit) {
    return (fahrenheit - 32.0) * 5.0 / 9.0;
}

std::optional<double> decode_temperature(std::span<const uint8_t> data, bool metric) {
    if (data.size() != 2) {
        return std::nullopt;
    }

    uint16_t raw = static_cast<uint16_t>(data[0] | (data[1] << 8));
    double temp = raw * TEMPERATURE_SCALE;
    if (!metric) {
        temp = celsius_to_fahrenheit(temp);
    }
    return round2(temp);
}

std::optional<std::array<uint8_t, 2>> encode_temperature(double celsius) {
    if (!std::isfinite(celsius)) {
        return std::nullopt;
    }

    double scaled = std::round(celsius / TEMPERATURE_SCALE);
    if (scaled < 0.0 || scaled > std::numeric_limits<uint16_t>::max()) {
        return std::nullopt;
    }

    auto raw = static_cast<uint16_t>(scaled);
    return std::array<uint8_t, 2>{static_cast<uint8_t>(raw & 0xFF),
                                  static_cast<uint8_t>(raw >> 8)};
}

std::optional<double> decode_battery(std::span<const uint8_t> data) {
    if (data.empty()) {
        return std::nullopt;
    }
    // Protocol never reports above 100, clamp anyway so the state stays in range
    return round2(std::min<double>(data[0], 100.0));
}

std::optional<LedColor> decode_color(std::span<const uint8_t> data) {
    // Payload: R G B A
    if (data.size() < 3) {
        return std::nullopt;
    }
    return LedColor{data[0], data[1], data[2]};
}

std::string format_color_hex(uint8_t r, uint8_t g, uint8_t b) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "#";
    for (uint8_t c : {r, g, b}) {
        out += digits[c >> 4];
        out += digits[c & 0x0F];
    }
    return out;
}

std::string format_color_hex(const LedColor& color) {
    return format_color_hex(color.r, color.g, color.b);
}

std::optional<uint8_t> decode_status(std::span<const uint8_t> data) {
    if (data.empty()) {
        return std::nullopt;
    }
    return data[0];
}

std::string to_hex(std::span<const uint8_t> data) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        out += digits[byte >> 4];
        out += digits[byte & 0x0F];
    }
    return out;
}

std::optional<std::array<uint8_t, 6>> parse_address(std::string_view address) {
    std::array<uint8_t, 6> result{};

    // Expect format: AA:BB:CC:DD:EE:FF
    if (address.size() != 17) {
        return std::nullopt;
    }

    for (size_t i = 0; i < result.size(); ++i) {
        size_t offset = i * 3;
        if (i > 0 && address[offset - 1] != ':') {
            return std::nullopt;
        }
        auto part = address.substr(offset, 2);
        uint8_t value;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value, 16);
        if (ec != std::errc{} || ptr != part.data() + part.size()) {
            return std::nullopt;
        }
        result[i] = value;
    }

    return result;
}

} // namespace ember::codec
