/// @file chart_json.cpp
/// @brief Chart → JSON.

#include "chart/chart_json.hpp"

#include <string>

namespace natal::chart
{

void to_json(json& j, const SignPosition& p)
{
    j = json{
        {"sign", std::string(sign_name(p.sign))},
        {"degrees", p.degrees},
        {"totalDegrees", p.total_degrees},
    };
}

void to_json(json& j, const PlanetPosition& p)
{
    j = json{
        {"planet", std::string(point_name(p.planet))},
        {"sign", std::string(sign_name(p.sign))},
        {"degrees", p.degrees},
        {"totalDegrees", p.total_degrees},
        {"house", p.house},
        {"retrograde", p.retrograde},
    };
}

void to_json(json& j, const ChartAspect& a)
{
    j = json{
        {"planet1", std::string(point_name(a.planet1))},
        {"planet2", std::string(point_name(a.planet2))},
        {"aspectName", a.aspect_name},
        {"aspectSymbol", a.aspect_symbol},
        {"exactDegrees", a.exact_degrees},
        {"actualDegrees", a.actual_degrees},
        {"orb", a.orb},
        {"nature", std::string(nature_name(a.nature))},
    };
}

void to_json(json& j, const NatalChart& chart)
{
    j = json::object();
    for (const ChartPoint point : kPlanets)
    {
        j[std::string(point_name(point))] = chart.planet(point);
    }
    j["ascendant"]  = chart.ascendant;
    j["midheaven"]  = chart.midheaven;
    j["aspects"]    = chart.aspects;
    j["houseCusps"] = chart.house_cusps;
}

void to_json(json& j, const BirthData& birth)
{
    const ResolvedBirthData r = resolve(birth);
    j = json{
        {"year", r.year},
        {"month", r.month},
        {"day", r.day},
        {"hour", r.hour},
        {"minute", r.minute},
        {"latitude", r.latitude},
        {"longitude", r.longitude},
        {"timezone", r.timezone},
    };
}

} // namespace natal::chart
