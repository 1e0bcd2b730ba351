/// @file astrology_reading.cpp
/// @brief Reveal protocol implementation.

#include "reading/astrology_reading.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <utility>

namespace natal::reading
{

namespace
{

using chart::ChartPoint;

constexpr std::array<ChartPoint, 11> kRevealOrder{
    ChartPoint::Sun, ChartPoint::Moon, ChartPoint::Ascendant,
    ChartPoint::Mercury, ChartPoint::Venus, ChartPoint::Mars,
    ChartPoint::Jupiter, ChartPoint::Saturn, ChartPoint::Uranus,
    ChartPoint::Neptune, ChartPoint::Pluto,
};

bool contains(const std::vector<ChartPoint>& points, ChartPoint point)
{
    return std::find(points.begin(), points.end(), point) != points.end();
}

bool in_reveal_order(ChartPoint point)
{
    return std::find(kRevealOrder.begin(), kRevealOrder.end(), point) != kRevealOrder.end();
}

// First index with the highest count; ties resolve to table order.
template <std::size_t N>
std::size_t dominant_index(const std::array<i32, N>& counts)
{
    return static_cast<std::size_t>(std::max_element(counts.begin(), counts.end()) - counts.begin());
}

} // anonymous namespace

AstrologyEngine::AstrologyEngine(chart::ChartCalculator calculator)
    : m_calculator(std::move(calculator))
{
}

const std::array<ChartPoint, 11>& AstrologyEngine::reveal_order()
{
    return kRevealOrder;
}

AstrologyReadingState AstrologyEngine::start_reading(const chart::BirthData& birth) const
{
    auto natal = std::make_shared<const chart::NatalChart>(m_calculator.calculate(birth));

    NATAL_INFO("Reading started: sun in {}, moon in {}, {} rising",
               chart::sign_name(natal->sun().sign),
               chart::sign_name(natal->moon().sign),
               chart::sign_name(natal->ascendant.sign));

    return AstrologyReadingState{
        .birth_data       = birth,
        .chart            = std::move(natal),
        .revealed_planets = {},
        .revealed_houses  = {},
        .feedback         = {},
    };
}

std::optional<Reveal> AstrologyEngine::get_next_reveal(const AstrologyReadingState& state) const
{
    for (const ChartPoint point : kRevealOrder)
    {
        if (!contains(state.revealed_planets, point))
        {
            return Reveal{.point = point, .position = state.chart->position_of(point)};
        }
    }
    return std::nullopt;
}

AstrologyReadingState AstrologyEngine::record_feedback(const AstrologyReadingState& state,
                                                       ChartPoint point,
                                                       FeedbackEntry feedback) const
{
    AstrologyReadingState next = state;
    next.feedback.push_back(std::move(feedback));

    if (in_reveal_order(point) && !contains(next.revealed_planets, point))
    {
        next.revealed_planets.push_back(point);
    }

    NATAL_TRACE("Feedback recorded for {} ({} of {} revealed)",
                chart::point_name(point), next.revealed_planets.size(), kRevealOrder.size());

    return next;
}

ReadingSynthesis AstrologyEngine::get_synthesis(const AstrologyReadingState& state) const
{
    const chart::NatalChart& natal = *state.chart;

    std::array<i32, 4> elements{};
    std::array<i32, 3> modalities{};
    for (const chart::PlanetPosition& pos : natal.planets)
    {
        ++elements[static_cast<std::size_t>(chart::element_of(pos.sign))];
        ++modalities[static_cast<std::size_t>(chart::modality_of(pos.sign))];
    }

    return ReadingSynthesis{
        .sun_sign          = natal.sun().sign,
        .moon_sign         = natal.moon().sign,
        .ascendant_sign    = natal.ascendant.sign,
        .planets           = natal.planets,
        .aspects           = natal.aspects,
        .revealed          = state.revealed_planets,
        .element_counts    = elements,
        .modality_counts   = modalities,
        .dominant_element  = static_cast<chart::Element>(dominant_index(elements)),
        .dominant_modality = static_cast<chart::Modality>(dominant_index(modalities)),
        .feedback_count    = state.feedback.size(),
        .complete          = is_complete(state),
    };
}

bool AstrologyEngine::is_complete(const AstrologyReadingState& state) const
{
    return state.revealed_planets.size() >= kRevealOrder.size();
}

chart::Sign AstrologyEngine::get_sun_sign(i32 month, i32 day) const
{
    return chart::sun_sign_for_date(month, day);
}

chart::NatalChart AstrologyEngine::compute_chart(const chart::BirthData& birth) const
{
    return m_calculator.calculate(birth);
}

} // namespace natal::reading
