#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace chromatone {

/**
 * @brief A single sampled color as three 8-bit channels.
 *
 * Construct through from_hex() or from_channels(); both validate their input
 * and throw InvalidColorFormat on anything that is not a byte-range triple.
 */
struct Rgb {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    /**
     * @brief Decodes "#RRGGBB" (the '#' is optional, digits are
     * case-insensitive).
     * @throws InvalidColorFormat on wrong length or non-hex characters
     */
    static Rgb from_hex(std::string_view hex);

    /**
     * @brief Builds a color from integer channels.
     * @throws InvalidColorFormat if any channel is outside [0,255]
     */
    static Rgb from_channels(int red, int green, int blue);

    /** @brief Lowercase "#rrggbb". */
    std::string to_hex() const;

    bool operator==(const Rgb &other) const = default;
};

} // namespace chromatone

template <>
struct fmt::formatter<chromatone::Rgb> {
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const chromatone::Rgb &color, FormatContext &ctx) const
        -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "#{:02x}{:02x}{:02x}", color.r,
                              color.g, color.b);
    }
};
