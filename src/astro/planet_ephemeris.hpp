#pragma once

/// @file planet_ephemeris.hpp
/// @brief Heliocentric and geocentric ecliptic longitudes from mean elements.

#include "astro/orbital_elements.hpp"
#include "core/types.hpp"

#include <string_view>

namespace natal::astro
{
    /// @brief Position of a body within its own orbit.
    struct OrbitPosition
    {
        f64 longitude_deg;  ///< Longitude in the orbit, v + ϖ (degrees, [0, 360))
        f64 radius_au;      ///< Heliocentric distance a(1 − e·cos E) (AU)
    };

    /// @brief Static utility class for planetary longitudes.
    ///
    /// A planar two-body model: the geocentric conversion ignores ecliptic
    /// latitude, which is adequate for sign and house placement (1–2 degree
    /// error for the inner planets) but not for declination-sensitive work.
    class PlanetEphemeris
    {
    public:
        PlanetEphemeris() = delete;

        /// @brief Heliocentric ecliptic longitude (degrees, [0, 360)).
        [[nodiscard]] static f64 heliocentric_longitude(Body body, f64 jd);

        /// @throws natal::UnknownBody for an unknown identifier.
        [[nodiscard]] static f64 heliocentric_longitude(std::string_view id, f64 jd);

        /// @brief In-orbit longitude and radius used by the geocentric conversion.
        [[nodiscard]] static OrbitPosition orbit_position(Body body, f64 jd);

        /// @brief Geocentric ecliptic longitude (degrees, [0, 360)).
        /// @throws natal::InvalidOperation if @p body is Earth.
        [[nodiscard]] static f64 geocentric_longitude(Body body, f64 jd);

        /// @throws natal::UnknownBody for an unknown identifier.
        /// @throws natal::InvalidOperation for "earth".
        [[nodiscard]] static f64 geocentric_longitude(std::string_view id, f64 jd);

        /// @brief True when the body moves backwards along the ecliptic as seen
        /// from Earth, judged from its longitude one day either side of @p jd.
        [[nodiscard]] static bool is_retrograde(Body body, f64 jd);

    private:
        /// @brief Solve the orbit at @p jd: returns true anomaly (deg) and
        /// fills the eccentric anomaly.
        [[nodiscard]] static f64 true_anomaly(const CurrentElements& el, f64& eccentric_anomaly);
    };

} // namespace natal::astro
