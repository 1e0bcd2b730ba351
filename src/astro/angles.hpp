#pragma once

/// @file angles.hpp
/// @brief Degree-based angle helpers shared by the ephemeris and chart code.

#include "core/types.hpp"

#include <cmath>

namespace natal::astro
{
    /// @brief Normalize an angle in degrees to [0, 360).
    [[nodiscard]] inline f64 normalize_degrees(f64 deg)
    {
        f64 result = std::fmod(deg, 360.0);
        if (result < 0.0)
        {
            result += 360.0;
        }
        // fmod of a tiny negative value can round back up to exactly 360
        if (result >= 360.0)
        {
            result -= 360.0;
        }
        return result;
    }

    [[nodiscard]] inline f64 to_radians(f64 deg)
    {
        return deg * astro_constants::kDegToRad;
    }

    [[nodiscard]] inline f64 to_degrees(f64 rad)
    {
        return rad * astro_constants::kRadToDeg;
    }

    /// @brief Signed shortest-path difference (to − from), in (−180, 180].
    [[nodiscard]] inline f64 shortest_arc(f64 from_deg, f64 to_deg)
    {
        f64 diff = to_deg - from_deg;
        if (diff > 180.0)
        {
            diff -= 360.0;
        }
        if (diff < -180.0)
        {
            diff += 360.0;
        }
        return diff;
    }

    /// @brief Unsigned separation of two ecliptic longitudes, folded to [0, 180].
    [[nodiscard]] inline f64 angular_separation(f64 deg1, f64 deg2)
    {
        f64 diff = std::abs(deg1 - deg2);
        if (diff > 180.0)
        {
            diff = 360.0 - diff;
        }
        return diff;
    }

    /// @brief Round to two decimal places (display precision of chart fields).
    [[nodiscard]] inline f64 round2(f64 value)
    {
        return std::round(value * 100.0) / 100.0;
    }

} // namespace natal::astro
