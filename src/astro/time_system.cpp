/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include "astro/angles.hpp"
#include "core/types.hpp"

#include <cmath>

namespace natal::astro
{

// -----------------------------------------------------------------
// Julian Day: Meeus algorithm (Astronomical Algorithms, Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_day(i32 year, i32 month, f64 day, f64 hour, f64 minute)
{
    i32 y = year;
    i32 m = month;

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian calendar correction. floor() rather than integer division
    // keeps the century term right for negative years.
    const f64 a = std::floor(static_cast<f64>(y) / 100.0);
    const f64 b = 2.0 - a + std::floor(a / 4.0);

    const f64 day_fraction = (hour + minute / 60.0) / 24.0;

    return std::floor(365.25 * static_cast<f64>(y + 4716))
         + std::floor(30.6001 * static_cast<f64>(m + 1))
         + day
         + day_fraction
         + b
         - 1524.5;
}

// -----------------------------------------------------------------
// Julian centuries since J2000.0
// -----------------------------------------------------------------

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / astro_constants::kDaysPerJulianCentury;
}

// -----------------------------------------------------------------
// GMST: IAU 1982 formula
//
// GMST (degrees) = 280.46061837
//                + 360.98564736629 × (JD − 2451545.0)
//                + 0.000387933 × T²
//                − T³ / 38710000
// -----------------------------------------------------------------

f64 TimeSystem::gmst_degrees(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 d = jd - astro_constants::kJ2000;

    return normalize_degrees(280.46061837
                           + 360.98564736629 * d
                           + 0.000387933 * t * t
                           - (t * t * t) / 38710000.0);
}

// -----------------------------------------------------------------
// LST = GMST + observer longitude
// -----------------------------------------------------------------

f64 TimeSystem::lst_degrees(f64 jd, f64 longitude_deg)
{
    return normalize_degrees(gmst_degrees(jd) + longitude_deg);
}

} // namespace natal::astro
