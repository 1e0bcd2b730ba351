/// @file test_sun_moon.cpp
/// @brief Unit tests for the closed-form Sun and Moon longitude series.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/angles.hpp"
#include "astro/sun_moon.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace natal;
using namespace natal::astro;

static constexpr f64 kLonTolDeg = 1e-6;

static bool near(f64 a, f64 b, f64 tol)
{
    return std::abs(a - b) <= tol;
}

// =================================================================
// Sun
// =================================================================

TEST_CASE("Sun longitude at J2000.0")
{
    CHECK(near(sun_longitude(2451545.0), 280.3725548788095, kLonTolDeg));
}

TEST_CASE("Sun longitude 1990-03-25 17:00 UT")
{
    CHECK(near(sun_longitude(2447976.2083333335), 4.787342592357837, kLonTolDeg));
}

TEST_CASE("Sun crosses the equinoxes and solstices near the expected dates")
{
    // Within a day of the real events, the Sun moves ~1°/day
    const f64 march  = sun_longitude(TimeSystem::to_julian_day(2024, 3, 20, 3.0, 6.0));
    const f64 june   = sun_longitude(TimeSystem::to_julian_day(2024, 6, 20, 20.0, 51.0));
    const f64 sept   = sun_longitude(TimeSystem::to_julian_day(2024, 9, 22, 12.0, 44.0));
    const f64 dec    = sun_longitude(TimeSystem::to_julian_day(2024, 12, 21, 9.0, 20.0));

    CHECK(angular_separation(march, 0.0) < 0.1);
    CHECK(angular_separation(june, 90.0) < 0.1);
    CHECK(angular_separation(sept, 180.0) < 0.1);
    CHECK(angular_separation(dec, 270.0) < 0.1);
}

TEST_CASE("Sun advances roughly one degree per day")
{
    const f64 jd = 2451545.0;
    for (f64 t = 0.0; t < 365.0; t += 30.0)
    {
        const f64 step = shortest_arc(sun_longitude(jd + t), sun_longitude(jd + t + 1.0));
        CHECK(step > 0.95);
        CHECK(step < 1.03);
    }
}

// =================================================================
// Moon
// =================================================================

TEST_CASE("Moon longitude at J2000.0")
{
    CHECK(near(moon_longitude(2451545.0), 223.31383791999522, kLonTolDeg));
}

TEST_CASE("Moon longitude 1990-03-25 17:00 UT")
{
    CHECK(near(moon_longitude(2447976.2083333335), 349.46955655080524, kLonTolDeg));
}

TEST_CASE("Moon moves 11.5 to 15.5 degrees per day")
{
    const f64 jd = 2451545.0;
    for (f64 t = 0.0; t < 60.0; t += 1.5)
    {
        const f64 step = shortest_arc(moon_longitude(jd + t), moon_longitude(jd + t + 1.0));
        CHECK(step > 11.5);
        CHECK(step < 15.5);
    }
}

TEST_CASE("Sun and Moon longitudes stay in [0, 360)")
{
    for (f64 jd = 1684594.5; jd < 2488070.0; jd += 9999.7)
    {
        const f64 sun  = sun_longitude(jd);
        const f64 moon = moon_longitude(jd);
        CHECK(sun >= 0.0);
        CHECK(sun < 360.0);
        CHECK(moon >= 0.0);
        CHECK(moon < 360.0);
    }
}
