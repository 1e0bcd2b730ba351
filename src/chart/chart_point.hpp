#pragma once

/// @file chart_point.hpp
/// @brief Identifiers for the positions a chart exposes.

#include "core/types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace natal::chart
{
    /// @brief The ten chart planets plus the two angle pseudo-points.
    enum class ChartPoint : u8
    {
        Sun,
        Moon,
        Mercury,
        Venus,
        Mars,
        Jupiter,
        Saturn,
        Uranus,
        Neptune,
        Pluto,
        Ascendant,
        Midheaven,
    };

    /// @brief Real bodies in chart order (sun…pluto).
    inline constexpr std::array<ChartPoint, 10> kPlanets{
        ChartPoint::Sun, ChartPoint::Moon, ChartPoint::Mercury, ChartPoint::Venus,
        ChartPoint::Mars, ChartPoint::Jupiter, ChartPoint::Saturn, ChartPoint::Uranus,
        ChartPoint::Neptune, ChartPoint::Pluto,
    };

    [[nodiscard]] constexpr bool is_planet(ChartPoint point)
    {
        return point != ChartPoint::Ascendant && point != ChartPoint::Midheaven;
    }

    /// @brief Lowercase identifier ("sun", "ascendant", ...).
    [[nodiscard]] std::string_view point_name(ChartPoint point);

    [[nodiscard]] std::optional<ChartPoint> parse_point(std::string_view name);

} // namespace natal::chart
