/// @file kepler.cpp
/// @brief Kepler equation solver.

#include "astro/kepler.hpp"

#include <cmath>

namespace natal::astro
{

f64 solve_kepler(f64 mean_anomaly_rad, f64 eccentricity) noexcept
{
    f64 e_anom = mean_anomaly_rad;

    for (i32 i = 0; i < kKeplerMaxIterations; ++i)
    {
        const f64 step = (e_anom - eccentricity * std::sin(e_anom) - mean_anomaly_rad)
                       / (1.0 - eccentricity * std::cos(e_anom));
        e_anom -= step;
        if (std::abs(step) < kKeplerTolerance)
        {
            break;
        }
    }

    return e_anom;
}

} // namespace natal::astro
