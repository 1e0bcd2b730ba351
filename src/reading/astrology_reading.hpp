#pragma once

/// @file astrology_reading.hpp
/// @brief Step-by-step reveal of a natal chart with user feedback.
///
/// A reading walks a fixed order of chart points. Every transition returns a
/// new state value; earlier states stay valid and share the same chart.

#include "chart/natal_chart.hpp"
#include "core/types.hpp"

#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace natal::reading
{
    using Clock = std::chrono::system_clock;

    /// @brief One user reaction to a revealed chart point.
    struct FeedbackEntry
    {
        chart::ChartPoint element;
        std::string user_text;
        Clock::time_point timestamp;

        bool operator==(const FeedbackEntry&) const = default;
    };

    /// @brief Immutable snapshot of a reading session.
    struct AstrologyReadingState
    {
        chart::BirthData birth_data;
        std::shared_ptr<const chart::NatalChart> chart;
        std::vector<chart::ChartPoint> revealed_planets;  ///< Reveal order, no duplicates
        std::vector<i32> revealed_houses;                 ///< Not populated yet
        std::vector<FeedbackEntry> feedback;
    };

    /// @brief The next point to present and where it sits in the chart.
    struct Reveal
    {
        chart::ChartPoint point;
        chart::PlanetPosition position;
    };

    /// @brief Summary of a reading, available at any stage.
    struct ReadingSynthesis
    {
        chart::Sign sun_sign;
        chart::Sign moon_sign;
        chart::Sign ascendant_sign;
        std::array<chart::PlanetPosition, 10> planets;
        std::vector<chart::ChartAspect> aspects;
        std::vector<chart::ChartPoint> revealed;
        std::array<i32, 4> element_counts;    ///< fire, earth, air, water
        std::array<i32, 3> modality_counts;   ///< cardinal, fixed, mutable
        chart::Element dominant_element;
        chart::Modality dominant_modality;
        std::size_t feedback_count;
        bool complete;
    };

    /// @brief Stateless driver of the reveal protocol.
    ///
    /// Feedback recording is permissive: any point may receive feedback at
    /// any time, before or after completion and regardless of what
    /// get_next_reveal() last returned. Points outside the reveal order
    /// (midheaven) keep their feedback but are not marked revealed.
    class AstrologyEngine
    {
    public:
        explicit AstrologyEngine(chart::ChartCalculator calculator);

        /// @brief sun, moon, ascendant, mercury … pluto.
        [[nodiscard]] static const std::array<chart::ChartPoint, 11>& reveal_order();

        /// @brief Compute the chart and open a reading with nothing revealed.
        [[nodiscard]] AstrologyReadingState start_reading(const chart::BirthData& birth) const;

        /// @brief First point of the reveal order not yet revealed, or
        /// std::nullopt once all have been.
        [[nodiscard]] std::optional<Reveal> get_next_reveal(const AstrologyReadingState& state) const;

        /// @brief Append feedback and mark @p point revealed.
        [[nodiscard]] AstrologyReadingState record_feedback(const AstrologyReadingState& state,
                                                            chart::ChartPoint point,
                                                            FeedbackEntry feedback) const;

        [[nodiscard]] ReadingSynthesis get_synthesis(const AstrologyReadingState& state) const;

        [[nodiscard]] bool is_complete(const AstrologyReadingState& state) const;

        [[nodiscard]] chart::Sign get_sun_sign(i32 month, i32 day) const;

        [[nodiscard]] chart::NatalChart compute_chart(const chart::BirthData& birth) const;

    private:
        chart::ChartCalculator m_calculator;
    };

} // namespace natal::reading
