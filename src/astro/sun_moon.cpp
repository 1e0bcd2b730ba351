/// @file sun_moon.cpp
/// @brief Solar and lunar longitude series.

#include "astro/sun_moon.hpp"

#include "astro/angles.hpp"
#include "astro/time_system.hpp"

#include <array>
#include <cmath>

namespace natal::astro
{

namespace
{

/// One periodic term: coefficient × sin(d·D + m·M + mp·M′ + f·F),
/// coefficient in units of 1e-6 degree.
struct LunarTerm
{
    i32 d;
    i32 m;
    i32 mp;
    i32 f;
    f64 coefficient;
};

constexpr std::array<LunarTerm, 24> kLunarLongitudeTerms{{
    {0,  0,  1,  0,  6288774.0},
    {2,  0, -1,  0,  1274027.0},
    {2,  0,  0,  0,   658314.0},
    {0,  0,  2,  0,   213618.0},
    {0,  1,  0,  0,  -185116.0},
    {0,  0,  0,  2,  -114332.0},
    {2,  0, -2,  0,    58793.0},
    {2, -1, -1,  0,    57066.0},
    {2,  0,  1,  0,    53322.0},
    {2, -1,  0,  0,    45758.0},
    {0,  1, -1,  0,   -40923.0},
    {1,  0,  0,  0,   -34720.0},
    {0,  1,  1,  0,   -30383.0},
    {2,  0,  0, -2,    15327.0},
    {0,  0,  1,  2,   -12528.0},
    {0,  0,  1, -2,    10980.0},
    {4,  0, -1,  0,    10675.0},
    {0,  0,  3,  0,    10034.0},
    {4,  0, -2,  0,     8548.0},
    {2,  1, -1,  0,    -7888.0},
    {2,  1,  0,  0,    -6766.0},
    {1,  0, -1,  0,    -5163.0},
    {1,  1,  0,  0,     4987.0},
    {2, -1,  1,  0,     4036.0},
}};

} // anonymous namespace

// -----------------------------------------------------------------
// Sun (Meeus Ch. 25, low accuracy)
// -----------------------------------------------------------------

f64 sun_longitude(f64 jd)
{
    const f64 t = TimeSystem::julian_centuries(jd);

    const f64 mean_lon = normalize_degrees(280.46646 + 36000.76983 * t + 0.0003032 * t * t);
    const f64 mean_anom = to_radians(normalize_degrees(357.52911 + 35999.05029 * t - 0.0001537 * t * t));

    const f64 centre = (1.914602 - 0.004817 * t - 0.000014 * t * t) * std::sin(mean_anom)
                     + (0.019993 - 0.000101 * t) * std::sin(2.0 * mean_anom)
                     + 0.000289 * std::sin(3.0 * mean_anom);

    const f64 true_lon = normalize_degrees(mean_lon + centre);

    const f64 omega = 125.04 - 1934.136 * t;
    return normalize_degrees(true_lon - 0.00569 - 0.00478 * std::sin(to_radians(omega)));
}

// -----------------------------------------------------------------
// Moon (Meeus Ch. 47, principal longitude terms)
// -----------------------------------------------------------------

f64 moon_longitude(f64 jd)
{
    const f64 t  = TimeSystem::julian_centuries(jd);
    const f64 t2 = t * t;
    const f64 t3 = t2 * t;
    const f64 t4 = t3 * t;

    // Mean longitude
    const f64 lp = normalize_degrees(218.3164477 + 481267.88123421 * t
                                     - 0.0015786 * t2 + t3 / 538841.0 - t4 / 65194000.0);
    // Mean elongation
    const f64 d = normalize_degrees(297.8501921 + 445267.1114034 * t
                                    - 0.0018819 * t2 + t3 / 545868.0 - t4 / 113065000.0);
    // Sun's mean anomaly
    const f64 m = normalize_degrees(357.5291092 + 35999.0502909 * t
                                    - 0.0001536 * t2 + t3 / 24490000.0);
    // Moon's mean anomaly
    const f64 mp = normalize_degrees(134.9633964 + 477198.8675055 * t
                                     + 0.0087414 * t2 + t3 / 69699.0 - t4 / 14712000.0);
    // Argument of latitude
    const f64 f = normalize_degrees(93.2720950 + 483202.0175233 * t
                                    - 0.0036539 * t2 - t3 / 3526000.0 + t4 / 863310000.0);

    const f64 d_rad  = to_radians(d);
    const f64 m_rad  = to_radians(m);
    const f64 mp_rad = to_radians(mp);
    const f64 f_rad  = to_radians(f);

    f64 sum = 0.0;
    for (const auto& term : kLunarLongitudeTerms)
    {
        const f64 arg = term.d * d_rad + term.m * m_rad + term.mp * mp_rad + term.f * f_rad;
        sum += term.coefficient * std::sin(arg);
    }

    return normalize_degrees(lp + sum / 1'000'000.0);
}

} // namespace natal::astro
