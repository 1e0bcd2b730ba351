/// @file test_kepler.cpp
/// @brief Unit tests for the Newton–Raphson Kepler solver.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/kepler.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace natal;
using namespace natal::astro;

static f64 residual(f64 E, f64 M, f64 e)
{
    return std::abs(E - e * std::sin(E) - M);
}

// =================================================================
// Degenerate and symmetric cases
// =================================================================

TEST_CASE("Circular orbit: E equals M")
{
    for (const f64 M : {0.0, 0.3, 1.0, 2.5, astro_constants::kPi, 5.9})
    {
        CHECK(solve_kepler(M, 0.0) == doctest::Approx(M).epsilon(1e-14));
    }
}

TEST_CASE("M = 0 and M = π are fixed points for any eccentricity")
{
    CHECK(solve_kepler(0.0, 0.9) == 0.0);
    CHECK(solve_kepler(astro_constants::kPi, 0.3) == doctest::Approx(astro_constants::kPi).epsilon(1e-14));
}

TEST_CASE("Reference value: M = 1 rad, e = 0.5")
{
    CHECK(solve_kepler(1.0, 0.5) == doctest::Approx(1.4987011335178484).epsilon(1e-12));
}

// =================================================================
// Convergence across the eccentricity range
// =================================================================

// Starting from E0 = M with a 50-step cap, Newton iteration can diverge
// above e = 0.9 (e = 0.99 near M = 6.5 blows up), so the sweep stops there.
TEST_CASE("Residual below 1e-9 for e up to 0.9")
{
    for (f64 e = 0.0; e <= 0.9 + 1e-9; e += 0.05)
    {
        for (f64 M = -astro_constants::kTwoPi; M <= astro_constants::kTwoPi; M += 0.1)
        {
            const f64 E = solve_kepler(M, e);
            CHECK(residual(E, M, e) < 1e-9);
        }
    }
}

TEST_CASE("Planetary eccentricities converge tightly")
{
    // Mercury, Earth, Pluto
    for (const f64 e : {0.20563593, 0.01671123, 0.24882730})
    {
        const f64 M = 4.2;
        CHECK(residual(solve_kepler(M, e), M, e) < 1e-12);
    }
}

TEST_CASE("Solver is an odd function of M")
{
    const f64 e = 0.4;
    CHECK(solve_kepler(-1.2, e) == doctest::Approx(-solve_kepler(1.2, e)).epsilon(1e-12));
}
