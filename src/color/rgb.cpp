#include "rgb.hpp"

#include "../utility/exceptions.hpp"

namespace chromatone {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

Rgb Rgb::from_hex(std::string_view hex) {
    std::string_view digits = hex;
    if (!digits.empty() && digits.front() == '#') {
        digits.remove_prefix(1);
    }

    if (digits.size() != 6) {
        throw InvalidColorFormat(
            fmt::format("'{}' must have exactly 6 hex digits", hex));
    }

    int channels[3];
    for (int i = 0; i < 3; ++i) {
        int hi = hex_digit(digits[2 * i]);
        int lo = hex_digit(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw InvalidColorFormat(
                fmt::format("'{}' contains non-hex characters", hex));
        }
        channels[i] = hi * 16 + lo;
    }

    return from_channels(channels[0], channels[1], channels[2]);
}

Rgb Rgb::from_channels(int red, int green, int blue) {
    for (int channel : {red, green, blue}) {
        if (channel < 0 || channel > 255) {
            throw InvalidColorFormat(fmt::format(
                "({}, {}, {}) has a channel outside [0,255]", red, green,
                blue));
        }
    }
    return Rgb{static_cast<std::uint8_t>(red), static_cast<std::uint8_t>(green),
               static_cast<std::uint8_t>(blue)};
}

std::string Rgb::to_hex() const { return fmt::format("{}", *this); }

} // namespace chromatone
