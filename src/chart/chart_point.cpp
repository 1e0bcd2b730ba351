/// @file chart_point.cpp
/// @brief Chart point names.

#include "chart/chart_point.hpp"

namespace natal::chart
{

namespace
{

constexpr std::array<std::string_view, 12> kPointNames{
    "sun", "moon", "mercury", "venus", "mars", "jupiter",
    "saturn", "uranus", "neptune", "pluto", "ascendant", "midheaven",
};

} // anonymous namespace

std::string_view point_name(ChartPoint point)
{
    return kPointNames[static_cast<std::size_t>(point)];
}

std::optional<ChartPoint> parse_point(std::string_view name)
{
    for (std::size_t i = 0; i < kPointNames.size(); ++i)
    {
        if (kPointNames[i] == name)
        {
            return static_cast<ChartPoint>(i);
        }
    }
    return std::nullopt;
}

} // namespace natal::chart
