/// @file test_chart_angles.cpp
/// @brief Unit tests for obliquity, Ascendant and Midheaven.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/angles.hpp"
#include "astro/chart_angles.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace natal;
using namespace natal::astro;

static constexpr f64 kAngleTolDeg = 1e-6;

static bool same_angle(f64 a, f64 b, f64 tol = kAngleTolDeg)
{
    return angular_separation(a, b) <= tol;
}

// =================================================================
// Obliquity
// =================================================================

TEST_CASE("Obliquity at J2000.0 is 23.4392911°")
{
    CHECK(obliquity_degrees(2451545.0) == doctest::Approx(23.4392911).epsilon(1e-12));
}

TEST_CASE("Obliquity decreases slowly with time")
{
    CHECK(obliquity_degrees(2451545.0 + 36525.0) == doctest::Approx(23.4262872396).epsilon(1e-10));
    CHECK(obliquity_degrees(2451545.0 - 365250.0) == doctest::Approx(23.5688131).epsilon(1e-10));
    CHECK(obliquity_degrees(2460000.0) < obliquity_degrees(2451545.0));
}

// =================================================================
// Midheaven
// =================================================================

TEST_CASE("Midheaven coincides with LST at the cardinal points")
{
    CHECK(same_angle(midheaven_degrees(0.0, 23.44), 0.0));
    CHECK(same_angle(midheaven_degrees(90.0, 23.44), 90.0));
    CHECK(same_angle(midheaven_degrees(180.0, 23.44), 180.0));
    CHECK(same_angle(midheaven_degrees(270.0, 23.44), 270.0));
}

TEST_CASE("Midheaven lies in the same quadrant as LST")
{
    for (f64 lst = 5.0; lst < 360.0; lst += 10.0)
    {
        const f64 mc = midheaven_degrees(lst, 23.44);
        CHECK(std::floor(mc / 90.0) == std::floor(lst / 90.0));
    }
}

TEST_CASE("Midheaven for New York at J2000.0")
{
    CHECK(same_angle(midheaven_degrees(206.45461837, 23.4392911), 208.4730289412198));
}

// =================================================================
// Ascendant
// =================================================================

TEST_CASE("Ascendant at the equator for cardinal LST values")
{
    CHECK(same_angle(ascendant_degrees(0.0, 0.0, 23.44), 270.0));
    CHECK(same_angle(ascendant_degrees(270.0, 0.0, 23.44), 180.0));
    CHECK(same_angle(ascendant_degrees(180.0, 0.0, 23.44), 90.0));
}

TEST_CASE("Ascendant for New York at J2000.0")
{
    CHECK(same_angle(ascendant_degrees(206.45461837, 40.7128, 23.4392911), 94.24361567871462));
}

TEST_CASE("Ascendant in the southern hemisphere")
{
    CHECK(same_angle(ascendant_degrees(100.0, -33.9, 23.44), 15.265957582460583));
}

TEST_CASE("Ascendant is always in [0, 360)")
{
    for (f64 lat = -66.0; lat <= 66.0; lat += 11.0)
    {
        for (f64 lst = 0.0; lst < 360.0; lst += 15.0)
        {
            const f64 asc = ascendant_degrees(lst, lat, 23.44);
            CHECK(asc >= 0.0);
            CHECK(asc < 360.0);
        }
    }
}
