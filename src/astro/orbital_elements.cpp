/// @file orbital_elements.cpp
/// @brief Element table and epoch evaluation.

#include "astro/orbital_elements.hpp"

#include "astro/angles.hpp"
#include "core/errors.hpp"

#include <string>

namespace natal::astro
{

namespace
{

struct BodyRecord
{
    Body body;
    std::string_view name;
    OrbitalElements elements;
};

// Columns: L0, L1, a, e0, e1, I0, I1, W0, W1, w0, w1
constexpr std::array<BodyRecord, kBodyCount> kBodyTable{{
    {Body::Mercury, "mercury",
     {252.25032350, 149472.67411175, 0.38709927, 0.20563593, 0.00001906,
      7.00497902, -0.00594749, 48.33076593, -0.12534081, 77.45779628, 0.16047689}},
    {Body::Venus, "venus",
     {181.97909950, 58517.81538729, 0.72333566, 0.00677672, -0.00004107,
      3.39467605, -0.00078890, 76.67984255, -0.27769418, 131.60246718, 0.00268329}},
    {Body::Earth, "earth",
     {100.46457166, 35999.37244981, 1.00000261, 0.01671123, -0.00004392,
      0.00001531, -0.01294668, 0.0, 0.0, 102.93768193, 0.32327364}},
    {Body::Mars, "mars",
     {355.44656299, 19140.30268499, 1.52371034, 0.09339410, 0.00007882,
      1.84969142, -0.00813131, 49.55953891, -0.29257343, 336.05637041, 0.44441088}},
    {Body::Jupiter, "jupiter",
     {34.39644051, 3034.74612775, 5.20288700, 0.04838624, -0.00013253,
      1.30439695, -0.00183714, 100.47390909, 0.20469106, 14.72847983, 0.21252668}},
    {Body::Saturn, "saturn",
     {49.95424423, 1222.49362201, 9.53667594, 0.05386179, -0.00050991,
      2.48599187, 0.00193609, 113.66242448, -0.28867794, 92.59887831, -0.41897216}},
    {Body::Uranus, "uranus",
     {313.23810451, 428.48202785, 19.18916464, 0.04725744, -0.00004397,
      0.77263783, -0.00242939, 74.01692503, 0.04240589, 170.95427630, 0.40805281}},
    {Body::Neptune, "neptune",
     {304.87997031, 218.45945325, 30.06992276, 0.00859048, 0.00005105,
      1.77004347, 0.00035372, 131.78422574, -0.01299630, 44.96476227, -0.32241464}},
    {Body::Pluto, "pluto",
     {238.92903833, 145.20780515, 39.48211675, 0.24882730, 0.00005170,
      17.14001206, 0.00004818, 110.30393684, -0.01183482, 224.06891629, -0.04062942}},
}};

constexpr std::array<Body, kBodyCount> kAllBodies{
    Body::Mercury, Body::Venus, Body::Earth, Body::Mars, Body::Jupiter,
    Body::Saturn, Body::Uranus, Body::Neptune, Body::Pluto,
};

} // anonymous namespace

CurrentElements OrbitalElements::at(f64 t) const
{
    return CurrentElements{
        .mean_longitude       = normalize_degrees(L0 + L1 * t),
        .semi_major_axis      = a,
        .eccentricity         = e0 + e1 * t,
        .inclination          = I0 + I1 * t,
        .ascending_node       = normalize_degrees(W0 + W1 * t),
        .perihelion_longitude = normalize_degrees(w0 + w1 * t),
    };
}

std::string_view body_name(Body body)
{
    return kBodyTable[static_cast<std::size_t>(body)].name;
}

std::optional<Body> parse_body(std::string_view id)
{
    for (const auto& record : kBodyTable)
    {
        if (record.name == id)
        {
            return record.body;
        }
    }
    return std::nullopt;
}

const OrbitalElements& elements_for(Body body)
{
    return kBodyTable[static_cast<std::size_t>(body)].elements;
}

const OrbitalElements& elements_for(std::string_view id)
{
    const auto body = parse_body(id);
    if (!body)
    {
        throw UnknownBody(std::string(id));
    }
    return elements_for(*body);
}

const std::array<Body, kBodyCount>& all_bodies()
{
    return kAllBodies;
}

} // namespace natal::astro
