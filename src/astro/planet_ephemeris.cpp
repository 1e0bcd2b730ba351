/// @file planet_ephemeris.cpp
/// @brief Implementation of the planetary longitude pipeline.

#include "astro/planet_ephemeris.hpp"

#include "astro/angles.hpp"
#include "astro/kepler.hpp"
#include "astro/time_system.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <string>

namespace natal::astro
{

namespace
{

Body require_body(std::string_view id)
{
    const auto body = parse_body(id);
    if (!body)
    {
        throw UnknownBody(std::string(id));
    }
    return *body;
}

} // anonymous namespace

// -----------------------------------------------------------------
// True anomaly from the current elements
//
// M = L − ϖ,  M = E − e·sin E,
// v = atan2(√(1−e²)·sin E, cos E − e)
// -----------------------------------------------------------------

f64 PlanetEphemeris::true_anomaly(const CurrentElements& el, f64& eccentric_anomaly)
{
    const f64 e = el.eccentricity;
    const f64 mean_anomaly = normalize_degrees(el.mean_longitude - el.perihelion_longitude);

    eccentric_anomaly = solve_kepler(to_radians(mean_anomaly), e);

    return to_degrees(std::atan2(std::sqrt(1.0 - e * e) * std::sin(eccentric_anomaly),
                                 std::cos(eccentric_anomaly) - e));
}

// -----------------------------------------------------------------
// Heliocentric ecliptic longitude
//
// u   = v + ϖ − Ω              (argument of latitude)
// λ   = atan2(sin u · cos I, cos u) + Ω
// -----------------------------------------------------------------

f64 PlanetEphemeris::heliocentric_longitude(Body body, f64 jd)
{
    const CurrentElements el = elements_for(body).at(TimeSystem::julian_centuries(jd));

    f64 ecc_anom = 0.0;
    const f64 v = true_anomaly(el, ecc_anom);

    const f64 u = to_radians(normalize_degrees(v + el.perihelion_longitude - el.ascending_node));
    const f64 incl = to_radians(el.inclination);

    return normalize_degrees(
        to_degrees(std::atan2(std::sin(u) * std::cos(incl), std::cos(u))) + el.ascending_node);
}

f64 PlanetEphemeris::heliocentric_longitude(std::string_view id, f64 jd)
{
    return heliocentric_longitude(require_body(id), jd);
}

OrbitPosition PlanetEphemeris::orbit_position(Body body, f64 jd)
{
    const CurrentElements el = elements_for(body).at(TimeSystem::julian_centuries(jd));

    f64 ecc_anom = 0.0;
    const f64 v = true_anomaly(el, ecc_anom);

    return OrbitPosition{
        .longitude_deg = normalize_degrees(v + el.perihelion_longitude),
        .radius_au     = el.semi_major_axis * (1.0 - el.eccentricity * std::cos(ecc_anom)),
    };
}

// -----------------------------------------------------------------
// Geocentric longitude: planar vector difference planet − Earth
// -----------------------------------------------------------------

f64 PlanetEphemeris::geocentric_longitude(Body body, f64 jd)
{
    if (body == Body::Earth)
    {
        throw InvalidOperation("Cannot compute geocentric longitude of Earth");
    }

    const OrbitPosition earth  = orbit_position(Body::Earth, jd);
    const OrbitPosition planet = orbit_position(body, jd);

    const f64 earth_rad  = to_radians(earth.longitude_deg);
    const f64 planet_rad = to_radians(planet.longitude_deg);

    const Vec2d earth_xy{earth.radius_au * std::cos(earth_rad), earth.radius_au * std::sin(earth_rad)};
    const Vec2d planet_xy{planet.radius_au * std::cos(planet_rad), planet.radius_au * std::sin(planet_rad)};
    const Vec2d geo = planet_xy - earth_xy;

    return normalize_degrees(to_degrees(std::atan2(geo.y, geo.x)));
}

f64 PlanetEphemeris::geocentric_longitude(std::string_view id, f64 jd)
{
    return geocentric_longitude(require_body(id), jd);
}

// -----------------------------------------------------------------
// Retrograde: sign of the shortest-path motion from JD−1 to JD+1
// -----------------------------------------------------------------

bool PlanetEphemeris::is_retrograde(Body body, f64 jd)
{
    const f64 before = geocentric_longitude(body, jd - 1.0);
    const f64 after  = geocentric_longitude(body, jd + 1.0);
    return shortest_arc(before, after) < 0.0;
}

} // namespace natal::astro
