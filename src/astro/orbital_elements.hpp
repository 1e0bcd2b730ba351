#pragma once

/// @file orbital_elements.hpp
/// @brief Mean Keplerian elements of the planets (J2000.0 ecliptic, Standish 1992).

#include "core/types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace natal::astro
{
    /// @brief Bodies with tabulated orbital elements. Earth is the observer.
    enum class Body : u8
    {
        Mercury,
        Venus,
        Earth,
        Mars,
        Jupiter,
        Saturn,
        Uranus,
        Neptune,
        Pluto,
    };

    inline constexpr std::size_t kBodyCount = 9;

    /// @brief Elements evaluated for a particular epoch.
    struct CurrentElements
    {
        f64 mean_longitude;         ///< L (degrees, [0, 360))
        f64 semi_major_axis;        ///< a (AU)
        f64 eccentricity;           ///< e
        f64 inclination;            ///< I (degrees, not normalized)
        f64 ascending_node;         ///< Ω (degrees, [0, 360))
        f64 perihelion_longitude;   ///< ϖ (degrees, [0, 360))
    };

    /// @brief Elements at J2000.0 plus secular rates per Julian century.
    struct OrbitalElements
    {
        f64 L0;  ///< Mean longitude (deg)
        f64 L1;  ///< Mean longitude rate (deg / century)
        f64 a;   ///< Semi-major axis (AU)
        f64 e0;  ///< Eccentricity
        f64 e1;  ///< Eccentricity rate (/ century)
        f64 I0;  ///< Inclination (deg)
        f64 I1;  ///< Inclination rate (deg / century)
        f64 W0;  ///< Longitude of ascending node (deg)
        f64 W1;  ///< Node rate (deg / century)
        f64 w0;  ///< Longitude of perihelion (deg)
        f64 w1;  ///< Perihelion rate (deg / century)

        /// @brief Evaluate the elements at T Julian centuries from J2000.0.
        [[nodiscard]] CurrentElements at(f64 t) const;
    };

    /// @brief Lowercase identifier of a body ("mercury", "earth", ...).
    [[nodiscard]] std::string_view body_name(Body body);

    /// @brief Parse a lowercase identifier. Returns std::nullopt if unknown.
    [[nodiscard]] std::optional<Body> parse_body(std::string_view id);

    /// @brief Element record for a body.
    [[nodiscard]] const OrbitalElements& elements_for(Body body);

    /// @brief Element record by identifier.
    /// @throws natal::UnknownBody if the identifier has no elements.
    [[nodiscard]] const OrbitalElements& elements_for(std::string_view id);

    /// @brief Every body in table order.
    [[nodiscard]] const std::array<Body, kBodyCount>& all_bodies();

} // namespace natal::astro
