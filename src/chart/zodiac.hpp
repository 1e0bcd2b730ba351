#pragma once

/// @file zodiac.hpp
/// @brief Tropical zodiac signs and their traditional attributes.

#include "core/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace natal::chart
{
    /// @brief The twelve signs in ecliptic order, Aries at 0°.
    enum class Sign : u8
    {
        Aries,
        Taurus,
        Gemini,
        Cancer,
        Leo,
        Virgo,
        Libra,
        Scorpio,
        Sagittarius,
        Capricorn,
        Aquarius,
        Pisces,
    };

    enum class Element : u8
    {
        Fire,
        Earth,
        Air,
        Water,
    };

    enum class Modality : u8
    {
        Cardinal,
        Fixed,
        Mutable,
    };

    inline constexpr std::array<Sign, 12> kSignOrder{
        Sign::Aries, Sign::Taurus, Sign::Gemini, Sign::Cancer,
        Sign::Leo, Sign::Virgo, Sign::Libra, Sign::Scorpio,
        Sign::Sagittarius, Sign::Capricorn, Sign::Aquarius, Sign::Pisces,
    };

    /// @brief A point on the ecliptic expressed as sign + degrees within sign.
    ///
    /// Invariant: sign = kSignOrder[floor(total_degrees / 30)] and
    /// degrees = total_degrees − 30·floor(total_degrees / 30).
    struct SignPosition
    {
        Sign sign;
        f64 degrees;        ///< Degrees within the sign, [0, 30)
        f64 total_degrees;  ///< Ecliptic longitude, [0, 360)

        bool operator==(const SignPosition&) const = default;
    };

    /// @brief Map any longitude (degrees) onto the zodiac.
    [[nodiscard]] SignPosition degrees_to_sign(f64 total_degrees);

    /// @brief Lowercase English name ("aries", ...).
    [[nodiscard]] std::string_view sign_name(Sign sign);

    /// @brief Capitalized name for display ("Aries", ...).
    [[nodiscard]] std::string sign_display_name(Sign sign);

    [[nodiscard]] std::optional<Sign> parse_sign(std::string_view name);

    [[nodiscard]] Element element_of(Sign sign);
    [[nodiscard]] Modality modality_of(Sign sign);

    [[nodiscard]] std::string_view element_name(Element element);
    [[nodiscard]] std::string_view modality_name(Modality modality);

    /// @brief Modern ruling planet of a sign, lowercase ("mars" for Aries).
    [[nodiscard]] std::string_view ruling_planet(Sign sign);

    /// @brief Sun sign from the traditional calendar boundaries, no ephemeris.
    /// @param month Month in [1, 12].
    /// @param day   Day of month.
    [[nodiscard]] Sign sun_sign_for_date(i32 month, i32 day);

    /// @brief True when two longitudes are within @p orb of @p aspect_degrees apart.
    [[nodiscard]] bool is_aspect(f64 degrees1, f64 degrees2, f64 aspect_degrees, f64 orb);

} // namespace natal::chart
