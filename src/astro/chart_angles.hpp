#pragma once

/// @file chart_angles.hpp
/// @brief Obliquity of the ecliptic, Ascendant and Midheaven.

#include "core/types.hpp"

namespace natal::astro
{
    /// @brief Mean obliquity of the ecliptic in degrees (Laskar short form).
    [[nodiscard]] f64 obliquity_degrees(f64 jd);

    /// @brief Ecliptic longitude rising on the eastern horizon.
    ///
    /// asc = atan2(−cos θ, sin ε·tan φ + cos ε·sin θ)
    ///
    /// @param lst_deg       Local sidereal time θ (degrees).
    /// @param latitude_deg  Geographic latitude φ (degrees, north positive).
    /// @param obliquity_deg Obliquity ε (degrees).
    /// @return Ascendant longitude (degrees, [0, 360)).
    [[nodiscard]] f64 ascendant_degrees(f64 lst_deg, f64 latitude_deg, f64 obliquity_deg);

    /// @brief Ecliptic longitude culminating on the meridian.
    ///
    /// mc = atan2(sin θ, cos θ·cos ε)
    [[nodiscard]] f64 midheaven_degrees(f64 lst_deg, f64 obliquity_deg);

} // namespace natal::astro
