#pragma once

/// @file houses.hpp
/// @brief Equal-house cusps and house lookup.

#include "core/types.hpp"

#include <array>

namespace natal::chart
{
    using HouseCusps = std::array<f64, 12>;

    /// @brief Twelve cusps at ascendant + 30°·i, normalized to [0, 360).
    [[nodiscard]] HouseCusps equal_house_cusps(f64 ascendant_deg);

    /// @brief House (1..12) containing an ecliptic longitude.
    ///
    /// House i+1 spans [cusp_i, cusp_{i+1}); the span that wraps past 360°
    /// matches longitudes ≥ cusp_i or < cusp_{i+1}. Falls back to house 1
    /// (with a warning) if no span matches, which well-formed input never hits.
    [[nodiscard]] i32 house_for_longitude(f64 longitude_deg, const HouseCusps& cusps);

} // namespace natal::chart
