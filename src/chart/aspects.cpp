/// @file aspects.cpp
/// @brief Aspect table and calculator.

#include "chart/aspects.hpp"

#include "astro/angles.hpp"
#include "chart/natal_chart.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace natal::chart
{

std::string_view nature_name(AspectNature nature)
{
    switch (nature)
    {
        case AspectNature::Harmonious:  return "harmonious";
        case AspectNature::Challenging: return "challenging";
        case AspectNature::Neutral:     return "neutral";
    }
    return "neutral";
}

std::optional<AspectNature> parse_nature(std::string_view name)
{
    if (name == "harmonious")  return AspectNature::Harmonious;
    if (name == "challenging") return AspectNature::Challenging;
    if (name == "neutral")     return AspectNature::Neutral;
    return std::nullopt;
}

// -----------------------------------------------------------------
// AspectTable
// -----------------------------------------------------------------

AspectTable::AspectTable(std::vector<AspectDefinition> definitions)
    : m_definitions(std::move(definitions))
{
}

AspectTable AspectTable::builtin()
{
    return AspectTable({
        {"conjunction",  "Conjunction",  "☌",   0.0, 8.0, AspectNature::Neutral},
        {"semi-sextile", "Semi-Sextile", "⚺",  30.0, 2.0, AspectNature::Neutral},
        {"sextile",      "Sextile",      "⚹",  60.0, 6.0, AspectNature::Harmonious},
        {"square",       "Square",       "□",  90.0, 8.0, AspectNature::Challenging},
        {"trine",        "Trine",        "△", 120.0, 8.0, AspectNature::Harmonious},
        {"quincunx",     "Quincunx",     "⚻", 150.0, 3.0, AspectNature::Challenging},
        {"opposition",   "Opposition",   "☍", 180.0, 8.0, AspectNature::Challenging},
    });
}

const AspectDefinition* AspectTable::find(std::string_view id) const
{
    const auto it = std::find_if(m_definitions.begin(), m_definitions.end(),
                                 [id](const AspectDefinition& def) { return def.id == id; });
    return it == m_definitions.end() ? nullptr : &*it;
}

// -----------------------------------------------------------------
// Pairwise aspect search
// -----------------------------------------------------------------

std::vector<ChartAspect> calculate_aspects(std::span<const PlanetPosition> positions,
                                           const AspectTable& table)
{
    std::vector<ChartAspect> aspects;

    for (std::size_t i = 0; i < positions.size(); ++i)
    {
        for (std::size_t j = i + 1; j < positions.size(); ++j)
        {
            const PlanetPosition& p1 = positions[i];
            const PlanetPosition& p2 = positions[j];

            const f64 separation = astro::angular_separation(p1.total_degrees, p2.total_degrees);

            for (const AspectDefinition& def : table.definitions())
            {
                const f64 distance = std::abs(separation - def.degrees);
                if (distance <= def.orb)
                {
                    aspects.push_back(ChartAspect{
                        .planet1        = p1.planet,
                        .planet2        = p2.planet,
                        .aspect_name    = def.name,
                        .aspect_symbol  = def.symbol,
                        .exact_degrees  = def.degrees,
                        .actual_degrees = separation,
                        .orb            = astro::round2(distance),
                        .nature         = def.nature,
                    });
                }
            }
        }
    }

    std::stable_sort(aspects.begin(), aspects.end(),
                     [](const ChartAspect& a, const ChartAspect& b) { return a.orb < b.orb; });
    return aspects;
}

} // namespace natal::chart
