/// @file houses.cpp
/// @brief Equal-house system.

#include "chart/houses.hpp"

#include "astro/angles.hpp"
#include "core/logger.hpp"

namespace natal::chart
{

HouseCusps equal_house_cusps(f64 ascendant_deg)
{
    HouseCusps cusps{};
    for (std::size_t i = 0; i < cusps.size(); ++i)
    {
        cusps[i] = astro::normalize_degrees(ascendant_deg + 30.0 * static_cast<f64>(i));
    }
    return cusps;
}

i32 house_for_longitude(f64 longitude_deg, const HouseCusps& cusps)
{
    for (std::size_t i = 0; i < cusps.size(); ++i)
    {
        const f64 cusp = cusps[i];
        const f64 next = cusps[(i + 1) % cusps.size()];

        if (next > cusp)
        {
            if (longitude_deg >= cusp && longitude_deg < next)
            {
                return static_cast<i32>(i) + 1;
            }
        }
        else if (longitude_deg >= cusp || longitude_deg < next)
        {
            return static_cast<i32>(i) + 1;
        }
    }

    NATAL_CORE_WARN("house_for_longitude: no house matched {:.6f}, using house 1", longitude_deg);
    return 1;
}

} // namespace natal::chart
