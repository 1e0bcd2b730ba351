#pragma once

/// @file kepler.hpp
/// @brief Newton–Raphson solver for Kepler's equation.

#include "core/types.hpp"

namespace natal::astro
{
    inline constexpr i32 kKeplerMaxIterations = 50;
    inline constexpr f64 kKeplerTolerance     = 1e-12;

    /// @brief Solve M = E − e·sin(E) for the eccentric anomaly E.
    ///
    /// Starts from E = M and stops once a Newton step is below 1e-12 rad or
    /// after 50 iterations. The cap is a termination bound, not an error:
    /// the last iterate is returned even if it has not fully converged.
    ///
    /// @param mean_anomaly_rad Mean anomaly M (radians).
    /// @param eccentricity     Eccentricity e in [0, 1).
    /// @return Eccentric anomaly E (radians).
    [[nodiscard]] f64 solve_kepler(f64 mean_anomaly_rad, f64 eccentricity) noexcept;

} // namespace natal::astro
