#pragma once

/// @file chart_json.hpp
/// @brief nlohmann::json serialization of chart values.
///
/// Field names follow the chart's external shape: lowercase sign names,
/// totalDegrees/degrees/orb at 2 decimals, houses as integers.

#include "chart/natal_chart.hpp"

#include <nlohmann/json.hpp>

namespace natal::chart
{
    using json = nlohmann::json;

    void to_json(json& j, const SignPosition& p);
    void to_json(json& j, const PlanetPosition& p);
    void to_json(json& j, const ChartAspect& a);
    void to_json(json& j, const NatalChart& chart);
    void to_json(json& j, const BirthData& birth);

} // namespace natal::chart
