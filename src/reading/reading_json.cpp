/// @file reading_json.cpp
/// @brief Reading → JSON.

#include "reading/reading_json.hpp"

#include <string>

namespace natal::reading
{

void to_json(json& j, const FeedbackEntry& f)
{
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        f.timestamp.time_since_epoch()).count();
    j = json{
        {"element", std::string(chart::point_name(f.element))},
        {"userText", f.user_text},
        {"timestamp", ms},
    };
}

void to_json(json& j, const ReadingSynthesis& s)
{
    json planets = json::object();
    for (const chart::PlanetPosition& p : s.planets)
    {
        planets[std::string(chart::point_name(p.planet))] = json{
            {"sign", std::string(chart::sign_name(p.sign))},
            {"degrees", p.degrees},
            {"house", p.house},
        };
    }

    json aspects = json::array();
    for (const chart::ChartAspect& a : s.aspects)
    {
        aspects.push_back(json{
            {"planet1", std::string(chart::point_name(a.planet1))},
            {"planet2", std::string(chart::point_name(a.planet2))},
            {"aspectName", a.aspect_name},
            {"orb", a.orb},
        });
    }

    json revealed = json::array();
    for (const chart::ChartPoint point : s.revealed)
    {
        revealed.push_back(std::string(chart::point_name(point)));
    }

    j = json{
        {"sunSign", std::string(chart::sign_name(s.sun_sign))},
        {"moonSign", std::string(chart::sign_name(s.moon_sign))},
        {"ascendant", std::string(chart::sign_name(s.ascendant_sign))},
        {"planets", planets},
        {"aspects", aspects},
        {"revealed", revealed},
        {"dominantElement", std::string(chart::element_name(s.dominant_element))},
        {"dominantModality", std::string(chart::modality_name(s.dominant_modality))},
        {"feedbackCount", s.feedback_count},
        {"complete", s.complete},
    };
}

} // namespace natal::reading
