/// @file chart_angles.cpp
/// @brief Implementation of the horizon and meridian angles.

#include "astro/chart_angles.hpp"

#include "astro/angles.hpp"
#include "astro/time_system.hpp"

#include <cmath>

namespace natal::astro
{

f64 obliquity_degrees(f64 jd)
{
    const f64 t = TimeSystem::julian_centuries(jd);
    return 23.4392911
         - 0.0130042 * t
         - 1.64e-7 * t * t
         + 5.036e-7 * t * t * t;
}

f64 ascendant_degrees(f64 lst_deg, f64 latitude_deg, f64 obliquity_deg)
{
    const f64 lst = to_radians(lst_deg);
    const f64 lat = to_radians(latitude_deg);
    const f64 obl = to_radians(obliquity_deg);

    const f64 y = -std::cos(lst);
    const f64 x = std::sin(obl) * std::tan(lat) + std::cos(obl) * std::sin(lst);

    return normalize_degrees(to_degrees(std::atan2(y, x)));
}

f64 midheaven_degrees(f64 lst_deg, f64 obliquity_deg)
{
    const f64 lst = to_radians(lst_deg);
    const f64 obl = to_radians(obliquity_deg);

    return normalize_degrees(to_degrees(std::atan2(std::sin(lst), std::cos(lst) * std::cos(obl))));
}

} // namespace natal::astro
