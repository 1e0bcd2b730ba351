#pragma once

/// @file sun_moon.hpp
/// @brief Closed-form apparent longitudes of the Sun and Moon.

#include "core/types.hpp"

namespace natal::astro
{
    /// @brief Apparent geocentric ecliptic longitude of the Sun (degrees, [0, 360)).
    ///
    /// Mean longitude plus the equation of centre (M, 2M, 3M terms), less the
    /// nutation/aberration correction 0.00569° + 0.00478°·sin Ω.
    [[nodiscard]] f64 sun_longitude(f64 jd);

    /// @brief Geocentric ecliptic longitude of the Moon (degrees, [0, 360)).
    ///
    /// Mean longitude plus the 24 largest periodic terms of the lunar theory
    /// (Meeus, Astronomical Algorithms, Table 47.A).
    [[nodiscard]] f64 moon_longitude(f64 jd);

} // namespace natal::astro
